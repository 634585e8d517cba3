#include "history_pruner.hpp"
#include <spdlog/spdlog.h>

HistoryPruner::HistoryPruner(StatusRecorder& recorder, std::chrono::hours retention, std::chrono::milliseconds period)
    : recorder_(recorder), retention_(retention), period_(period) {}

HistoryPruner::~HistoryPruner() {
    stop();
}

void HistoryPruner::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&HistoryPruner::prune_loop, this);
    spdlog::info("History pruner started (retention {} days, every {} minutes)",
                 retention_.count() / 24, std::chrono::duration_cast<std::chrono::minutes>(period_).count());
}

void HistoryPruner::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HistoryPruner::prune_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        lock.unlock();
        if (!recorder_.prune(retention_)) {
            spdlog::warn("History prune failed, retrying in {} ms", period_.count());
        }
        lock.lock();

        cv_.wait_for(lock, period_, [this] { return !running_; });
    }
}
