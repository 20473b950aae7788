#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace tinythis {

ThreadPool::ThreadPool(const unsigned threads, std::string name)
    : name_(std::move(name)) {
    const unsigned count = threads == 0 ? 1 : threads;
    workers_.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    request_stop();
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    while (true) {
        std::function<void(const std::stop_token&)> task;
        {
            std::unique_lock lock(mtx_);
            if (!work_cv_.wait(lock, st, [this] { return stopping_ || !queue_.empty(); })) {
                return; // stop requested while idle
            }
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // packaged_task stores the exception in the future; anything else is a bug in the pool itself
        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("task escaped its future: ") + e.what(), name_);
        }
        task_done();
    }
}

void ThreadPool::task_done() {
    {
        std::lock_guard lock(mtx_);
        if (outstanding_ > 0) {
            --outstanding_;
        }
    }
    idle_cv_.notify_all();
}

size_t ThreadPool::busy() const {
    std::lock_guard lock(mtx_);
    return outstanding_;
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

bool ThreadPool::wait_idle_for(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mtx_);
    return idle_cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

size_t ThreadPool::request_stop() {
    size_t dropped = 0;
    {
        std::lock_guard lock(mtx_);
        stopping_ = true;
        dropped = queue_.size();
        queue_.clear();
        outstanding_ -= dropped;
    }
    if (dropped > 0) {
        Logger::log(LogLevel::Debug, "dropped " + std::to_string(dropped) + " queued task(s)", name_);
    }
    idle_cv_.notify_all();
    work_cv_.notify_all();
    for (auto& w : workers_) {
        w.request_stop();
    }
    return dropped;
}

} // namespace tinythis
