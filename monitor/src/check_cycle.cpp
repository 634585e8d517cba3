#include "check_cycle.hpp"
#include "retry_policy.hpp"
#include <spdlog/spdlog.h>

CheckCycle::CheckCycle(MonitorStore& store,
                       const ProbeDispatcher& dispatcher,
                       StatusRecorder& recorder,
                       NotificationGate& gate,
                       std::chrono::seconds fallback_delay)
    : store_(store),
      dispatcher_(dispatcher),
      recorder_(recorder),
      gate_(gate),
      fallback_delay_(fallback_delay) {}

CycleReport CheckCycle::run(const std::string& monitor_id, TaskState& state) {
    try {
        return execute(monitor_id, state);
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error in check cycle for monitor {}: {}", monitor_id, e.what());
        CycleReport report;
        report.next_delay = fallback_delay_;
        return report;
    }
}

CycleReport CheckCycle::execute(const std::string& monitor_id, TaskState& state) {
    CycleReport report;

    auto monitor = store_.get_monitor(monitor_id);
    if (!monitor || !monitor->active) {
        spdlog::info("Monitor {} is {}, ending its task", monitor_id, monitor ? "inactive" : "gone");
        report.terminate = true;
        return report;
    }

    auto probe = dispatcher_.run(*monitor);
    auto decision = RetryPolicy::evaluate(probe.ok, state.consecutive_failures, monitor->retries);
    state.consecutive_failures = decision.consecutive_failures;

    CheckOutcome outcome;
    outcome.monitor_id = monitor->id;
    outcome.status = decision.status;
    outcome.message = probe.message;
    outcome.ping_ms = probe.ping_ms;
    outcome.details = probe.details;
    outcome.timestamp = std::chrono::system_clock::now();

    if (decision.status == MonitorStatus::Up) {
        spdlog::debug("Monitor {} up: {}", monitor->id, outcome.message);
    } else {
        spdlog::debug("Monitor {} {} (failure {}/{}): {}", monitor->id, to_string(decision.status),
                      decision.consecutive_failures, monitor->retries, outcome.message);
    }

    try {
        if (!recorder_.record(outcome)) {
            spdlog::warn("Monitor {}: outcome not persisted, scheduling continues", monitor->id);
        }
    } catch (const MonitorNotFound&) {
        spdlog::info("Monitor {} was deleted during its check, ending its task", monitor->id);
        report.terminate = true;
        return report;
    }
    gate_.process(*monitor, state, outcome);

    report.status = decision.status;
    report.next_delay = RetryPolicy::next_delay(decision, *monitor);
    return report;
}
