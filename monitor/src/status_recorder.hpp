#pragma once

#include "monitor_store.hpp"
#include <chrono>
#include <optional>

class StatusRecorder {
public:
    explicit StatusRecorder(MonitorStore& store);

    // History row and cached status as one unit; false on a persistence failure.
    // MonitorNotFound propagates: a deleted monitor is not a storage fault.
    bool record(const CheckOutcome& outcome);

    // Removes history with timestamp < now - retention; nullopt when the store failed
    std::optional<std::size_t> prune(std::chrono::hours retention,
                                     std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    MonitorStore& store_;
};
