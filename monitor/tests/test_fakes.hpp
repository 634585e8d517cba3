#pragma once

#include "memory_store.hpp"
#include "notification_channel.hpp"
#include "probe.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Probe returning scripted results; repeats the last one when the script runs out
class ScriptedProbe : public Probe {
public:
    explicit ScriptedProbe(std::vector<bool> script = {true}) {
        for (bool ok : script) {
            results_.push_back(ok ? ProbeResult::success("ok", 1.0) : ProbeResult::failure("failed"));
        }
    }

    ProbeResult run(const Monitor&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_;
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        started_cv_.notify_all();

        if (block_) {
            release_cv_.wait(lock, [this] { return !block_; });
        }

        ProbeResult result = results_.empty() ? ProbeResult::success("ok") : results_.front();
        if (results_.size() > 1) {
            results_.pop_front();
        }
        --in_flight_;
        return result;
    }

    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        block_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            block_ = false;
        }
        release_cv_.notify_all();
    }

    bool wait_for_calls(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return started_cv_.wait_for(lock, timeout, [this, count] { return calls_ >= count; });
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable started_cv_;
    std::condition_variable release_cv_;
    std::deque<ProbeResult> results_;
    bool block_ = false;
    int calls_ = 0;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

class ThrowingProbe : public Probe {
public:
    ProbeResult run(const Monitor&) override {
        throw std::runtime_error("connection reset by peer");
    }
};

struct SentNotification {
    std::string monitor_id;
    TransitionKind kind;
    MonitorStatus status;
    std::string message;
};

class RecordingChannel : public NotificationChannel {
public:
    void notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back({monitor_id, kind, outcome.status, outcome.message});
        if (fail_) {
            throw std::runtime_error("webhook returned 500");
        }
    }

    std::vector<SentNotification> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::size_t count(TransitionKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& s : sent_) {
            if (s.kind == kind) ++n;
        }
        return n;
    }

    void set_failing(bool fail) { fail_ = fail; }

private:
    mutable std::mutex mutex_;
    std::vector<SentNotification> sent_;
    std::atomic<bool> fail_{false};
};

// Memory store whose writes can be switched to fail
class FlakyStore : public MemoryMonitorStore {
public:
    StatusRecord record_status(const CheckOutcome& outcome) override {
        if (fail_writes) {
            throw std::runtime_error("database is locked");
        }
        return MemoryMonitorStore::record_status(outcome);
    }

    std::size_t prune_older_than(std::chrono::system_clock::time_point cutoff) override {
        if (fail_writes) {
            throw std::runtime_error("database is locked");
        }
        return MemoryMonitorStore::prune_older_than(cutoff);
    }

    std::atomic<bool> fail_writes{false};
};

inline Monitor make_monitor(const std::string& id, MonitorType type = MonitorType::Port) {
    Monitor monitor;
    monitor.id = id;
    monitor.name = "monitor " + id;
    monitor.type = type;
    monitor.interval = 60;
    monitor.retries = 0;
    monitor.retry_interval = 60;
    switch (type) {
        case MonitorType::Http:
        case MonitorType::HttpsCert:
            monitor.config.url = "https://example.com/";
            break;
        case MonitorType::Keyword:
            monitor.config.url = "https://example.com/";
            monitor.config.keyword = "healthy";
            break;
        case MonitorType::Port:
        case MonitorType::Mysql:
        case MonitorType::Redis:
            monitor.config.hostname = "127.0.0.1";
            monitor.config.port = 5432;
            break;
        case MonitorType::Icmp:
            monitor.config.hostname = "127.0.0.1";
            break;
        case MonitorType::Push:
            break;
    }
    return monitor;
}

inline CheckOutcome make_outcome(const std::string& monitor_id,
                                 MonitorStatus status,
                                 std::chrono::system_clock::time_point ts = std::chrono::system_clock::now()) {
    CheckOutcome outcome;
    outcome.monitor_id = monitor_id;
    outcome.status = status;
    outcome.message = to_string(status);
    outcome.timestamp = ts;
    return outcome;
}
