#pragma once

#include "types.hpp"
#include <chrono>

struct RetryDecision {
    MonitorStatus status = MonitorStatus::Up;
    int consecutive_failures = 0;
    bool retrying = false;
};

// Pure decision: retry a failed check or confirm the monitor down
class RetryPolicy {
public:
    static RetryDecision evaluate(bool ok, int consecutive_failures, int retries);

    // retryInterval while retrying, interval otherwise
    static std::chrono::seconds next_delay(const RetryDecision& decision, const Monitor& monitor);
};
