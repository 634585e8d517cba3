#include "scheduler.hpp"
#include "monitor_validation.hpp"
#include <spdlog/spdlog.h>

Scheduler::Scheduler(MonitorStore& store, CheckCycle& cycle, SchedulerOptions options)
    : store_(store),
      cycle_(cycle),
      options_(options),
      pool_(options.max_concurrent_checks) {}

Scheduler::~Scheduler() {
    shutdown();
}

bool Scheduler::start() {
    if (running_) return true;
    if (shut_down_) {
        spdlog::error("Scheduler was shut down and cannot be restarted");
        return false;
    }
    timer_.start();
    running_ = true;

    std::vector<Monitor> monitors;
    try {
        monitors = store_.list_active_monitors();
    } catch (const std::exception& e) {
        spdlog::error("Failed to list active monitors: {}", e.what());
    }

    std::size_t armed = 0;
    for (const auto& monitor : monitors) {
        if (register_monitor(monitor)) ++armed;
    }
    spdlog::info("Scheduler started with {} of {} active monitors ({} workers)",
                 armed, monitors.size(), pool_.size());
    return true;
}

void Scheduler::shutdown() {
    if (!running_.exchange(false)) return;
    shut_down_ = true;

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto& entry : tasks_) {
            entry.second->cancelled = true;
        }
        tasks_.clear();
    }

    timer_.stop();
    pool_.shutdown();
    spdlog::info("Scheduler stopped.");
}

bool Scheduler::schedule(const std::string& monitor_id) {
    if (!running_) {
        spdlog::warn("Scheduler is not running, cannot schedule monitor {}", monitor_id);
        return false;
    }

    std::optional<Monitor> monitor;
    try {
        monitor = store_.get_monitor(monitor_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load monitor {}: {}", monitor_id, e.what());
        return false;
    }

    if (!monitor) {
        spdlog::info("Monitor {} not found, nothing to schedule", monitor_id);
        std::lock_guard<std::mutex> lock(registry_mutex_);
        cancel_locked(monitor_id);
        return false;
    }
    return register_monitor(*monitor);
}

bool Scheduler::register_monitor(const Monitor& monitor) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!monitor.active) {
        spdlog::info("Monitor {} is inactive, not scheduling", monitor.id);
        cancel_locked(monitor.id);
        return false;
    }

    auto errors = validate_monitor(monitor);
    if (!errors.empty()) {
        for (const auto& error : errors) {
            spdlog::warn("Monitor {} is invalid: {}", monitor.id, error);
        }
        cancel_locked(monitor.id);
        return false;
    }

    auto task = std::make_shared<ScheduledTask>();
    task->monitor_id = monitor.id;
    task->run_mutex = run_mutex_for(monitor.id);
    if (monitor.last_status == MonitorStatus::Up || monitor.last_status == MonitorStatus::Down) {
        task->state.last_reported = monitor.last_status;
    }

    cancel_locked(monitor.id);
    tasks_[monitor.id] = task;
    arm(task, std::chrono::seconds(0));

    spdlog::debug("Scheduled monitor {} ({}) every {}s", monitor.id, to_string(monitor.type), monitor.interval);
    return true;
}

bool Scheduler::stop(const std::string& monitor_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    bool found = tasks_.count(monitor_id) > 0;
    cancel_locked(monitor_id);
    if (found) {
        spdlog::info("Stopped monitor {}", monitor_id);
    }
    return found;
}

bool Scheduler::is_scheduled(const std::string& monitor_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return tasks_.count(monitor_id) > 0;
}

std::size_t Scheduler::task_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return tasks_.size();
}

std::size_t Scheduler::run_mutex_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return run_mutexes_.size();
}

void Scheduler::cancel_locked(const std::string& monitor_id) {
    auto it = tasks_.find(monitor_id);
    if (it == tasks_.end()) return;
    it->second->cancelled = true;
    tasks_.erase(it);
}

std::shared_ptr<std::mutex> Scheduler::run_mutex_for(const std::string& monitor_id) {
    auto& run_mutex = run_mutexes_[monitor_id];
    if (!run_mutex) {
        run_mutex = std::make_shared<std::mutex>();
    }
    return run_mutex;
}

void Scheduler::release_run_mutex_locked(const std::string& monitor_id, long owners) {
    if (tasks_.count(monitor_id) > 0) return;
    auto it = run_mutexes_.find(monitor_id);
    // The map holds one reference, each live generation another
    if (it != run_mutexes_.end() && it->second.use_count() <= owners) {
        run_mutexes_.erase(it);
    }
}

void Scheduler::arm(const std::shared_ptr<ScheduledTask>& task, std::chrono::seconds delay) {
    auto wall_delay = options_.time_unit * delay.count();
    bool armed = timer_.schedule_after(wall_delay, [this, task]() {
        if (task->cancelled) {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            release_run_mutex_locked(task->monitor_id, 2);
            return;
        }
        if (!pool_.submit([this, task]() { execute(task); })) {
            spdlog::debug("Worker pool closed, dropping run for monitor {}", task->monitor_id);
        }
    });
    if (!armed) {
        spdlog::debug("Timer stopped, not arming monitor {}", task->monitor_id);
    }
}

void Scheduler::execute(const std::shared_ptr<ScheduledTask>& task) {
    std::unique_lock<std::mutex> run_lock(*task->run_mutex, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        // An older generation is still probing; retry later instead of holding a worker
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = tasks_.find(task->monitor_id);
        if (it != tasks_.end() && it->second == task && !task->cancelled && running_) {
            spdlog::debug("Monitor {} still has a check in flight, deferring", task->monitor_id);
            arm(task, std::chrono::seconds(1));
        }
        return;
    }

    if (task->cancelled) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        release_run_mutex_locked(task->monitor_id, 2);
        return;
    }

    auto report = cycle_.run(task->monitor_id, task->state);

    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = tasks_.find(task->monitor_id);
    bool current = it != tasks_.end() && it->second == task;

    if (report.terminate) {
        task->cancelled = true;
        if (current) {
            tasks_.erase(it);
        }
        release_run_mutex_locked(task->monitor_id, 2);
        return;
    }

    if (!current || task->cancelled || !running_) {
        release_run_mutex_locked(task->monitor_id, 2);
        return;
    }
    arm(task, report.next_delay);
}
