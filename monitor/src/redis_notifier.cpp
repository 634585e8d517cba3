#include "redis_notifier.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_map>

RedisNotificationChannel::RedisNotificationChannel(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ensure_connection()) {
        spdlog::info("Publishing notifications to Redis stream {}", config_.notification_stream);
    }
}

RedisNotificationChannel::~RedisNotificationChannel() = default;

bool RedisNotificationChannel::ensure_connection() {
    if (redis_) {
        return true;
    }
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        redis_.reset();
        return false;
    }
}

void RedisNotificationChannel::notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connection()) {
        throw std::runtime_error("Redis is not reachable");
    }

    std::unordered_map<std::string, std::string> fields;
    fields["data"] = notification_payload(monitor_id, kind, outcome).dump();

    try {
        redis_->xadd(config_.notification_stream, "*", fields.begin(), fields.end());
    } catch (const sw::redis::IoError&) {
        // Reconnect on the next event
        redis_.reset();
        throw;
    }
    spdlog::debug("Published '{}' notification for monitor {}", to_string(kind), monitor_id);
}
