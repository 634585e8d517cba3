#pragma once

#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown when a write targets a monitor that no longer exists
class MonitorNotFound : public std::runtime_error {
public:
    explicit MonitorNotFound(const std::string& id)
        : std::runtime_error("Monitor not found: " + id), monitor_id_(id) {}

    const std::string& monitor_id() const { return monitor_id_; }

private:
    std::string monitor_id_;
};

// Configuration and history store the engine depends on.
// Implementations throw std::exception-derived errors on storage failures.
class MonitorStore {
public:
    virtual ~MonitorStore() = default;

    virtual std::optional<Monitor> get_monitor(const std::string& id) = 0;
    virtual std::vector<Monitor> list_active_monitors() = 0;
    // Push monitor whose Monitor::push_token() equals token
    virtual std::optional<Monitor> find_push_monitor(const std::string& token) = 0;
    virtual void update_cached_status(const std::string& id,
                                      MonitorStatus status,
                                      std::chrono::system_clock::time_point checked_at) = 0;

    virtual StatusRecord append_record(const CheckOutcome& outcome) = 0;

    // append_record + update_cached_status, visible to readers as a single unit
    virtual StatusRecord record_status(const CheckOutcome& outcome) = 0;

    // Deletes records with timestamp strictly older than cutoff
    virtual std::size_t prune_older_than(std::chrono::system_clock::time_point cutoff) = 0;

    // Newest first
    virtual std::vector<StatusRecord> recent_records(const std::string& monitor_id, std::size_t limit) = 0;
};

// Reads a JSON array of monitor definitions; malformed entries are logged and skipped.
// Throws std::runtime_error when the file is unreadable or not an array.
std::vector<Monitor> read_monitors_file(const std::string& path);
