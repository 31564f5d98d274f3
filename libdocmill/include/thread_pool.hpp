/**
 * @file thread_pool.hpp
 * @brief Defines a simple fixed-size, thread-safe thread pool.
 *
 * Used by BatchExecutor to process several files at once and by
 * PdfExtractor to OCR scanned pages in parallel.
 */

#ifndef DOCMILL_THREAD_POOL_HPP
#define DOCMILL_THREAD_POOL_HPP

#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace docmill {

/**
 * @brief A simple fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread instances, joined on destruction and
 * cancellable through std::stop_token. Enqueued tasks receive the worker's
 * `std::stop_token` as their only argument.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the pool and starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2);

    /**
     * @brief Lets queued tasks drain, then joins all workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F Callable accepting a `std::stop_token`.
     * @return A std::future for the task's result. Exceptions thrown by the
     * task are stored in the future.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto job = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
        std::future<R> result = job->get_future();
        {
            std::lock_guard lock(mutex_);
            if (closed_) throw std::runtime_error("enqueue on stopped ThreadPool");
            queue_.emplace_back([job](std::stop_token st) { (*job)(st); });
            ++pending_;
        }
        work_cv_.notify_one();
        return result;
    }

    /**
     * @brief Blocks the calling thread until all pending tasks are complete.
     */
    void wait_idle();

    /**
     * @brief Discards tasks that have not started and signals running ones.
     *
     * Futures of discarded tasks report std::future_errc::broken_promise.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /// @return Tasks queued or running.
    [[nodiscard]] std::size_t pending() const;

private:
    using Task = std::function<void(std::stop_token)>;

    void run_worker(const std::stop_token& st);
    void finish_task();

    mutable std::mutex mutex_;              ///< Guards queue_, closed_ and pending_
    std::condition_variable_any work_cv_;   ///< Wakes workers on new tasks or shutdown
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ drops to zero
    std::deque<Task> queue_;
    bool closed_ = false;
    std::size_t pending_ = 0;
    std::vector<std::jthread> workers_;
};

} // namespace docmill

#endif // DOCMILL_THREAD_POOL_HPP
