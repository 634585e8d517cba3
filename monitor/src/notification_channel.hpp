#pragma once

#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

// Downstream notification dispatch. Implementations may throw; callers log and move on.
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;
    virtual void notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) = 0;
};

// Event body shared by every channel
nlohmann::json notification_payload(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome);

// Used when no downstream bus is configured
class LogNotificationChannel : public NotificationChannel {
public:
    void notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) override;
};

// Fire-and-forget front for a slower channel; delivery happens on a background thread
class AsyncNotificationQueue : public NotificationChannel {
public:
    explicit AsyncNotificationQueue(std::shared_ptr<NotificationChannel> downstream);
    ~AsyncNotificationQueue() override;

    void start();
    // Delivers what is already queued, then joins the worker
    void stop();

    void notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) override;

    std::size_t pending() const;

private:
    struct Event {
        std::string monitor_id;
        TransitionKind kind = TransitionKind::WentDown;
        CheckOutcome outcome;
    };

    void delivery_loop();

    std::shared_ptr<NotificationChannel> downstream_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Event> queue_;
};
