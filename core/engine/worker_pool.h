#pragma once

#include "logging/logger.h"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

// Fixed-size executor for fire-and-forget work. Tasks have no result
// channel; an exception escaping a task is logged and dropped.
class WorkerPool {
public:
    WorkerPool(std::size_t threads, Logger& logger);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool has been shut down.
    bool submit(const std::string& name, std::function<void()> task);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    // Runs what is already queued, then joins the workers. Idempotent.
    void shutdown();

    std::size_t thread_count() const { return workers_.size(); }
    std::size_t pending() const;

private:
    struct Task {
        std::string name;
        std::function<void()> fn;
    };

    void worker_loop();
    void run(Task& task);

    Logger& logger_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::size_t active_ = 0;
    bool stopping_ = false;
};

} // namespace vigil
