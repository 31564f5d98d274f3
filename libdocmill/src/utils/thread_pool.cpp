#include <algorithm>

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace docmill {

ThreadPool::ThreadPool(unsigned threads) {
    threads = std::max(threads, 1u);
    workers_.reserve(threads);
    while (workers_.size() < threads) {
        workers_.emplace_back([this](const std::stop_token& st) { run_worker(st); });
    }
}

void ThreadPool::run_worker(const std::stop_token& st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            if (!work_cv_.wait(lock, st, [this] { return closed_ || !queue_.empty(); })) {
                return;
            }
            if (queue_.empty()) {
                return;  // closed and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            task(st);
        } catch (const std::exception& e) {
            // packaged_task keeps the task's own exceptions; this is the wrapper failing
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(),
                        "thread_pool");
        }
        finish_task();
    }
}

void ThreadPool::finish_task() {
    {
        std::lock_guard lock(mutex_);
        if (pending_ > 0) --pending_;
    }
    idle_cv_.notify_all();
}

std::size_t ThreadPool::pending() const {
    std::lock_guard lock(mutex_);
    return pending_;
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        pending_ -= std::min(pending_, queue_.size());
        queue_.clear();
    }
    idle_cv_.notify_all();
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    work_cv_.notify_all();
    // join before the jthread destructors request a stop, so queued tasks still run
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

} // namespace docmill
