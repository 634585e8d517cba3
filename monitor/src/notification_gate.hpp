#pragma once

#include "notification_channel.hpp"
#include "task_state.hpp"
#include <chrono>
#include <optional>

// Turns recorded outcomes into down / up / still_down notifications
class NotificationGate {
public:
    explicit NotificationGate(NotificationChannel& channel);

    static std::optional<TransitionKind> evaluate(std::optional<MonitorStatus> previous,
                                                  MonitorStatus current,
                                                  std::optional<std::chrono::system_clock::time_point> last_notified_at,
                                                  std::chrono::system_clock::time_point now,
                                                  int resend_interval);

    // Updates state and notifies; returns the transition that fired, if any.
    // Channel failures are logged and swallowed.
    std::optional<TransitionKind> process(const Monitor& monitor, TaskState& state, const CheckOutcome& outcome);

private:
    NotificationChannel& channel_;
};
