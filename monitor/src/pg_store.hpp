#pragma once

#include "config.hpp"
#include "monitor_store.hpp"
#include <memory>

// PostgreSQL-backed monitor configuration and status history
class PgMonitorStore : public MonitorStore {
public:
    explicit PgMonitorStore(const Config& config);
    ~PgMonitorStore() override;

    bool is_connected() const;

    // Create tables if they don't exist
    bool initialize_schema();

    // Inserts or replaces the monitor definition; cached status columns are left alone
    void save_monitor(const Monitor& monitor);

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
    PgMonitorStore(const PgMonitorStore&) = delete;
    PgMonitorStore& operator=(const PgMonitorStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
