#include "memory_store.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::size_t MemoryMonitorStore::load_from_file(const std::string& path) {
    auto monitors = read_monitors_file(path);
    for (const auto& monitor : monitors) {
        upsert_monitor(monitor);
    }

    spdlog::info("Loaded {} monitors from {}", monitors.size(), path);
    return monitors.size();
}

void MemoryMonitorStore::upsert_monitor(const Monitor& monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitors_[monitor.id] = monitor;
}

bool MemoryMonitorStore::remove_monitor(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitors_.erase(id) == 0) {
        return false;
    }
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&id](const StatusRecord& r) { return r.monitor_id == id; }),
                   records_.end());
    return true;
}

std::size_t MemoryMonitorStore::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::optional<Monitor> MemoryMonitorStore::get_monitor(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = monitors_.find(id);
    if (it == monitors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Monitor> MemoryMonitorStore::list_active_monitors() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Monitor> active;
    for (const auto& [id, monitor] : monitors_) {
        if (monitor.active) {
            active.push_back(monitor);
        }
    }
    return active;
}

void MemoryMonitorStore::update_cached_status(const std::string& id,
                                              MonitorStatus status,
                                              std::chrono::system_clock::time_point checked_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_locked(id, status, checked_at);
}

std::optional<Monitor> MemoryMonitorStore::find_push_monitor(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : monitors_) {
        if (entry.second.type == MonitorType::Push && entry.second.push_token() == token) {
            return entry.second;
        }
    }
    return std::nullopt;
}

StatusRecord MemoryMonitorStore::append_record(const CheckOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    return append_locked(outcome);
}

StatusRecord MemoryMonitorStore::record_status(const CheckOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitors_.find(outcome.monitor_id) == monitors_.end()) {
        throw MonitorNotFound(outcome.monitor_id);
    }
    auto record = append_locked(outcome);
    update_locked(outcome.monitor_id, outcome.status, outcome.timestamp);
    return record;
}

std::size_t MemoryMonitorStore::prune_older_than(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [cutoff](const StatusRecord& r) { return r.timestamp < cutoff; }),
                   records_.end());
    return before - records_.size();
}

std::vector<StatusRecord> MemoryMonitorStore::recent_records(const std::string& monitor_id, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StatusRecord> result;
    for (auto it = records_.rbegin(); it != records_.rend() && result.size() < limit; ++it) {
        if (it->monitor_id == monitor_id) {
            result.push_back(*it);
        }
    }
    return result;
}

StatusRecord MemoryMonitorStore::append_locked(const CheckOutcome& outcome) {
    StatusRecord record;
    record.id = util::generate_uuid();
    record.monitor_id = outcome.monitor_id;
    record.status = outcome.status;
    record.message = outcome.message;
    record.ping_ms = outcome.ping_ms;
    record.timestamp = outcome.timestamp;
    records_.push_back(record);
    return record;
}

void MemoryMonitorStore::update_locked(const std::string& id,
                                       MonitorStatus status,
                                       std::chrono::system_clock::time_point checked_at) {
    auto it = monitors_.find(id);
    if (it == monitors_.end()) {
        throw MonitorNotFound(id);
    }
    it->second.last_status = status;
    it->second.last_check_at = checked_at;
}
