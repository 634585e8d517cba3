#include "retry_policy.hpp"

RetryDecision RetryPolicy::evaluate(bool ok, int consecutive_failures, int retries) {
    RetryDecision decision;
    if (ok) {
        decision.status = MonitorStatus::Up;
        decision.consecutive_failures = 0;
        decision.retrying = false;
        return decision;
    }

    if (consecutive_failures < retries) {
        decision.status = MonitorStatus::Pending;
        decision.consecutive_failures = consecutive_failures + 1;
        decision.retrying = true;
        return decision;
    }

    // Counter stays put once confirmed down
    decision.status = MonitorStatus::Down;
    decision.consecutive_failures = consecutive_failures;
    decision.retrying = false;
    return decision;
}

std::chrono::seconds RetryPolicy::next_delay(const RetryDecision& decision, const Monitor& monitor) {
    if (decision.retrying) {
        return std::chrono::seconds(monitor.retry_interval);
    }
    return std::chrono::seconds(monitor.interval);
}
