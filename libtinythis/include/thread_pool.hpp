/**
 * @file thread_pool.hpp
 * @brief Fixed-size pool of std::jthread workers.
 *
 * The JobQueue runs encoder subprocesses on a single-worker pool, which
 * keeps subprocess I/O off the UI loop while still serializing encodes.
 */

#ifndef TINYTHIS_THREAD_POOL_HPP
#define TINYTHIS_THREAD_POOL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace tinythis {

/**
 * @brief A fixed-size thread pool with cooperative cancellation.
 *
 * @details Workers are std::jthread, so destruction requests stop and
 * joins. Tasks receive the worker's std::stop_token and are expected to
 * return promptly once it is triggered; an encode task reacts by
 * terminating its encoder.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     * @param name Used as the log tag of the workers.
     */
    explicit ThreadPool(unsigned threads = 1, std::string name = "pool");

    /**
     * @brief Requests stop, discards queued tasks and joins the workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a callable taking a `std::stop_token`.
     * @return A future for the callable's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using R = std::invoke_result_t<F, std::stop_token>;
        auto job = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
        std::future<R> result = job->get_future();
        {
            std::lock_guard lock(mtx_);
            if (stopping_) {
                throw std::runtime_error(name_ + ": enqueue after stop");
            }
            queue_.emplace_back([job](const std::stop_token& st) { (*job)(st); });
            ++outstanding_;
        }
        work_cv_.notify_one();
        return result;
    }

    /// Number of tasks queued or running.
    [[nodiscard]] size_t busy() const;

    /**
     * @brief Blocks until every enqueued task has finished.
     */
    void wait_idle();

    /**
     * @brief Like wait_idle(), bounded by @p timeout.
     * @return true if the pool went idle in time.
     */
    bool wait_idle_for(std::chrono::milliseconds timeout);

    /**
     * @brief Drops queued tasks and signals running ones through their stop_token.
     * @return Number of queued tasks that were dropped without running.
     */
    size_t request_stop();

private:
    void worker_loop(const std::stop_token& st);
    void task_done();

    std::string name_;
    mutable std::mutex mtx_;                       ///< Guards queue_, stopping_, outstanding_
    std::condition_variable_any work_cv_;          ///< Wakes workers for new tasks or stop
    std::condition_variable idle_cv_;              ///< Wakes wait_idle() when outstanding_ hits zero
    std::deque<std::function<void(const std::stop_token&)>> queue_;
    bool stopping_ = false;
    size_t outstanding_ = 0;                       ///< Queued plus running
    std::vector<std::jthread> workers_;
};

} // namespace tinythis

#endif // TINYTHIS_THREAD_POOL_HPP
