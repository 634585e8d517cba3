#pragma once

#include "check_cycle.hpp"
#include "monitor_store.hpp"
#include "task_state.hpp"
#include "timer_queue.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct SchedulerOptions {
    std::size_t max_concurrent_checks = 16;
    // Wall-clock length of one configured second
    std::chrono::milliseconds time_unit{1000};
    std::chrono::seconds fallback_delay{60};
};

// Owns one recurring task per active monitor
class Scheduler {
public:
    Scheduler(MonitorStore& store, CheckCycle& cycle, SchedulerOptions options = SchedulerOptions());
    ~Scheduler();

    // Starts the timer and arms a task for every active monitor.
    // A scheduler that was shut down cannot be started again.
    bool start();
    // Cancels every task and waits for in-flight checks
    void shutdown();

    // (Re)registers the task for id; false when the monitor is missing, inactive or invalid
    bool schedule(const std::string& monitor_id);
    // Idempotent; returns whether a task was removed
    bool stop(const std::string& monitor_id);

    bool is_scheduled(const std::string& monitor_id) const;
    std::size_t task_count() const;
    bool is_running() const { return running_; }
    // Number of monitor ids holding a run mutex
    std::size_t run_mutex_count() const;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

private:
    struct ScheduledTask {
        std::string monitor_id;
        std::atomic<bool> cancelled{false};
        // Shared by every generation of this monitor's task
        std::shared_ptr<std::mutex> run_mutex;
        TaskState state;
    };

    bool register_monitor(const Monitor& monitor);
    void cancel_locked(const std::string& monitor_id);
    std::shared_ptr<std::mutex> run_mutex_for(const std::string& monitor_id);
    // Drops the run mutex once no task and at most `owners` generations reference it
    void release_run_mutex_locked(const std::string& monitor_id, long owners);

    // Caller holds registry_mutex_
    void arm(const std::shared_ptr<ScheduledTask>& task, std::chrono::seconds delay);
    void execute(const std::shared_ptr<ScheduledTask>& task);

    MonitorStore& store_;
    CheckCycle& cycle_;
    SchedulerOptions options_;

    TimerQueue timer_;
    WorkerPool pool_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ScheduledTask>> tasks_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> run_mutexes_;
};
