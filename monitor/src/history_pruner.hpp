#pragma once

#include "status_recorder.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// Background retention sweep over the status history
class HistoryPruner {
public:
    HistoryPruner(StatusRecorder& recorder, std::chrono::hours retention, std::chrono::milliseconds period);
    ~HistoryPruner();

    void start();
    void stop();

private:
    void prune_loop();

    StatusRecorder& recorder_;
    std::chrono::hours retention_;
    std::chrono::milliseconds period_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};
