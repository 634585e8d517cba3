#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size pool; its size is the global cap on concurrent checks
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(std::size_t size);
    ~WorkerPool();

    bool submit(Job job);

    // Stops accepting work, lets queued and running jobs finish, joins the threads
    void shutdown();

    std::size_t size() const { return workers_.size(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Job> jobs_;
    bool accepting_ = true;
};
