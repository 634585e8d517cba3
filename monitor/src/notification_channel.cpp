#include "notification_channel.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

nlohmann::json notification_payload(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) {
    nlohmann::json payload = {
        {"id", util::generate_uuid()},
        {"monitorId", monitor_id},
        {"kind", to_string(kind)},
        {"status", static_cast<int>(outcome.status)},
        {"statusText", to_string(outcome.status)},
        {"message", outcome.message},
        {"ts", util::format_iso8601(outcome.timestamp)}
    };
    if (outcome.ping_ms) {
        payload["ping"] = *outcome.ping_ms;
    }
    if (!outcome.details.is_null() && !outcome.details.empty()) {
        payload["details"] = outcome.details;
    }
    return payload;
}

void LogNotificationChannel::notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) {
    if (kind == TransitionKind::Recovered) {
        spdlog::info("Monitor {} is UP: {}", monitor_id, outcome.message);
    } else {
        spdlog::warn("Monitor {} is DOWN ({}): {}", monitor_id, to_string(kind), outcome.message);
    }
}

AsyncNotificationQueue::AsyncNotificationQueue(std::shared_ptr<NotificationChannel> downstream)
    : downstream_(std::move(downstream)) {}

AsyncNotificationQueue::~AsyncNotificationQueue() {
    stop();
}

void AsyncNotificationQueue::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&AsyncNotificationQueue::delivery_loop, this);
    spdlog::info("Notification queue started.");
}

void AsyncNotificationQueue::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Notification queue stopped.");
}

void AsyncNotificationQueue::notify(const std::string& monitor_id, TransitionKind kind, const CheckOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(Event{monitor_id, kind, outcome});
    }
    queue_cv_.notify_one();
}

std::size_t AsyncNotificationQueue::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AsyncNotificationQueue::delivery_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) break; // Stopped and drained

            event = std::move(queue_.front());
            queue_.pop();
        }

        try {
            downstream_->notify(event.monitor_id, event.kind, event.outcome);
        } catch (const std::exception& e) {
            spdlog::error("Notification failure for monitor {} ({}): {}",
                          event.monitor_id, to_string(event.kind), e.what());
        }
    }
}
