#pragma once

#include "types.hpp"
#include <chrono>
#include <optional>

// Per-task memory carried from one check to the next
struct TaskState {
    int consecutive_failures = 0;
    // Last settled status (up or down); pending never lands here
    std::optional<MonitorStatus> last_reported;
    // Time of the last down / still_down notification
    std::optional<std::chrono::system_clock::time_point> last_notified_at;
};
