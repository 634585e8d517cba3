#include "status_recorder.hpp"
#include <spdlog/spdlog.h>

StatusRecorder::StatusRecorder(MonitorStore& store) : store_(store) {}

bool StatusRecorder::record(const CheckOutcome& outcome) {
    try {
        auto record = store_.record_status(outcome);
        spdlog::debug("Recorded {} for monitor {} ({})", to_string(record.status), record.monitor_id, record.id);
        return true;
    } catch (const MonitorNotFound&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Persistence failure for monitor {}: {}", outcome.monitor_id, e.what());
        return false;
    }
}

std::optional<std::size_t> StatusRecorder::prune(std::chrono::hours retention,
                                                 std::chrono::system_clock::time_point now) {
    auto cutoff = now - retention;
    try {
        auto deleted = store_.prune_older_than(cutoff);
        spdlog::info("Pruned {} status records older than {} days", deleted, retention.count() / 24);
        return deleted;
    } catch (const std::exception& e) {
        spdlog::error("Failed to prune status history: {}", e.what());
        return std::nullopt;
    }
}
