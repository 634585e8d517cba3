#include "heartbeat_registry.hpp"

void HeartbeatRegistry::record(const std::string& token, Heartbeat heartbeat) {
    std::lock_guard<std::mutex> lock(mutex_);
    heartbeats_[token] = std::move(heartbeat);
}

std::optional<Heartbeat> HeartbeatRegistry::last(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = heartbeats_.find(token);
    if (it == heartbeats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t HeartbeatRegistry::forget(const std::string& monitor_id, const std::string& keep_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = heartbeats_.begin(); it != heartbeats_.end();) {
        if (it->second.monitor_id == monitor_id && it->first != keep_token) {
            it = heartbeats_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t HeartbeatRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeats_.size();
}
