#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct Heartbeat {
    std::string monitor_id;
    std::chrono::system_clock::time_point received_at;
    bool ok = true;
    std::string message;
    std::optional<double> ping_ms;
};

// Last heartbeat per push token; written by the push endpoint, read by PushProbe
class HeartbeatRegistry {
public:
    void record(const std::string& token, Heartbeat heartbeat);
    std::optional<Heartbeat> last(const std::string& token) const;

    // Drops the monitor's heartbeats, except the one under keep_token
    std::size_t forget(const std::string& monitor_id, const std::string& keep_token = "");
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Heartbeat> heartbeats_;
};
