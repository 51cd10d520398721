#include "engine/worker_pool.h"

#include <exception>
#include <utility>

namespace vigil {

WorkerPool::WorkerPool(std::size_t threads, Logger& logger)
    : logger_(logger) {
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
        if (threads == 0) {
            threads = 4;
        }
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(const std::string& name, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push(Task{name, std::move(task)});
    }
    work_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and nothing left to run
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        run(task);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

void WorkerPool::run(Task& task) {
    try {
        task.fn();
    } catch (const std::exception& e) {
        logger_.log_event(LogLevel::ERROR, "task_failed",
                          {{"task", task.name}, {"error", e.what()}});
    }
}

} // namespace vigil
