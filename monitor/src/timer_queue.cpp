#include "timer_queue.hpp"
#include <spdlog/spdlog.h>

TimerQueue::TimerQueue() = default;

TimerQueue::~TimerQueue() {
    stop();
}

void TimerQueue::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&TimerQueue::timer_loop, this);
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = decltype(entries_)();
}

bool TimerQueue::schedule_after(std::chrono::milliseconds delay, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        entries_.push(Entry{std::chrono::steady_clock::now() + delay, next_seq_++, std::move(callback)});
    }
    cv_.notify_one();
    return true;
}

void TimerQueue::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return !entries_.empty() || !running_; });
            continue;
        }

        auto due = entries_.top().due;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue; // Re-evaluate: an earlier timer may have been added
        }

        Callback callback = entries_.top().callback;
        entries_.pop();
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            spdlog::error("Timer callback failed: {}", e.what());
        }
        lock.lock();
    }
}
