#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Single thread firing one-shot callbacks at their due time.
// Callbacks run on the timer thread and must be short (hand off to a WorkerPool).
class TimerQueue {
public:
    using Callback = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    void start();
    // Pending timers are dropped
    void stop();

    bool schedule_after(std::chrono::milliseconds delay, Callback callback);

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

private:
    struct Entry {
        std::chrono::steady_clock::time_point due;
        std::uint64_t seq;
        Callback callback;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.due != b.due) return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    void timer_loop();

    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> entries_;
    std::uint64_t next_seq_ = 0;
};
