#include "notification_gate.hpp"
#include <spdlog/spdlog.h>

NotificationGate::NotificationGate(NotificationChannel& channel) : channel_(channel) {}

std::optional<TransitionKind> NotificationGate::evaluate(std::optional<MonitorStatus> previous,
                                                         MonitorStatus current,
                                                         std::optional<std::chrono::system_clock::time_point> last_notified_at,
                                                         std::chrono::system_clock::time_point now,
                                                         int resend_interval) {
    switch (current) {
        case MonitorStatus::Pending:
            return std::nullopt;

        case MonitorStatus::Up:
            if (previous == MonitorStatus::Down) {
                return TransitionKind::Recovered;
            }
            return std::nullopt;

        case MonitorStatus::Down:
            if (previous != MonitorStatus::Down) {
                return TransitionKind::WentDown;
            }
            if (resend_interval > 0 && last_notified_at &&
                now - *last_notified_at >= std::chrono::seconds(resend_interval)) {
                return TransitionKind::StillDown;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<TransitionKind> NotificationGate::process(const Monitor& monitor, TaskState& state, const CheckOutcome& outcome) {
    if (outcome.status == MonitorStatus::Pending) {
        return std::nullopt;
    }

    auto now = outcome.timestamp;
    auto transition = evaluate(state.last_reported, outcome.status, state.last_notified_at, now,
                               monitor.resend_interval);

    // A down state inherited from the store has no notification time yet; resends count from here
    if (outcome.status == MonitorStatus::Down && !state.last_notified_at) {
        state.last_notified_at = now;
    }
    state.last_reported = outcome.status;

    if (!transition) {
        return std::nullopt;
    }

    if (*transition == TransitionKind::Recovered) {
        state.last_notified_at.reset();
    } else {
        state.last_notified_at = now;
    }

    spdlog::info("Monitor {} ({}) transition: {}", monitor.name, monitor.id, to_string(*transition));
    try {
        channel_.notify(monitor.id, *transition, outcome);
    } catch (const std::exception& e) {
        spdlog::error("Notification failure for monitor {}: {}", monitor.id, e.what());
    }
    return transition;
}
