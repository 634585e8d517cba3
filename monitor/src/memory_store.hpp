#pragma once

#include "monitor_store.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Process-local store; backs STORE_BACKEND=memory and the tests
class MemoryMonitorStore : public MonitorStore {
public:
    MemoryMonitorStore() = default;

    // Loads a JSON array of monitors, returns how many were accepted
    std::size_t load_from_file(const std::string& path);

    void upsert_monitor(const Monitor& monitor);
    bool remove_monitor(const std::string& id);
    std::size_t record_count() const;

    std::optional<Monitor> get_monitor(const std::string& id) override;
    std::vector<Monitor> list_active_monitors() override;
    std::optional<Monitor> find_push_monitor(const std::string& token) override;
    void update_cached_status(const std::string& id,
                              MonitorStatus status,
                              std::chrono::system_clock::time_point checked_at) override;
    StatusRecord append_record(const CheckOutcome& outcome) override;
    StatusRecord record_status(const CheckOutcome& outcome) override;
    std::size_t prune_older_than(std::chrono::system_clock::time_point cutoff) override;
    std::vector<StatusRecord> recent_records(const std::string& monitor_id, std::size_t limit) override;

    // Non-copyable
    MemoryMonitorStore(const MemoryMonitorStore&) = delete;
    MemoryMonitorStore& operator=(const MemoryMonitorStore&) = delete;

private:
    StatusRecord append_locked(const CheckOutcome& outcome);
    void update_locked(const std::string& id,
                       MonitorStatus status,
                       std::chrono::system_clock::time_point checked_at);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Monitor> monitors_;
    std::vector<StatusRecord> records_;
};
