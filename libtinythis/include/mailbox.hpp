/**
 * @file mailbox.hpp
 * @brief Multi-producer, single-consumer message queue.
 *
 * The encoder worker pushes progress and completion messages; the thread
 * that owns the JobQueue pops them and applies them to job state.
 */

#ifndef TINYTHIS_MAILBOX_HPP
#define TINYTHIS_MAILBOX_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace tinythis {

template <typename Message>
class Mailbox {
public:
    Mailbox() = default;

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    void push(Message message) {
        {
            std::lock_guard lock(mtx_);
            messages_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

    /// Returns the oldest message without blocking.
    [[nodiscard]] std::optional<Message> try_pop() {
        std::lock_guard lock(mtx_);
        return pop_locked();
    }

    /// Blocks up to @p timeout for a message.
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<Message> wait_pop(const std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !messages_.empty(); });
        return pop_locked();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard lock(mtx_);
        return messages_.empty();
    }

private:
    std::optional<Message> pop_locked() {
        if (messages_.empty()) {
            return std::nullopt;
        }
        Message m = std::move(messages_.front());
        messages_.pop_front();
        return m;
    }

    mutable std::mutex mtx_;         ///< Protects messages_
    std::condition_variable cv_;     ///< Signalled on push
    std::deque<Message> messages_;
};

} // namespace tinythis

#endif // TINYTHIS_MAILBOX_HPP
