#pragma once

#include "config.hpp"
#include "notification_channel.hpp"
#include <memory>
#include <mutex>

namespace sw {
namespace redis {
class Redis;
}
}

// Publishes transition events to a Redis stream as {"data": <json>}
class RedisNotificationChannel : public NotificationChannel {
public:
    explicit RedisNotificationChannel(const Config& config);
    ~RedisNotificationChannel() override;

    // Throws when Redis is unreachable or the XADD fails
    void notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) override;


private:
    bool ensure_connection();

    Config config_;
    std::mutex mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
};
