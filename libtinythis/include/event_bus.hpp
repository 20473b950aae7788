/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus for job lifecycle events.
 */

#ifndef TINYTHIS_EVENT_BUS_HPP
#define TINYTHIS_EVENT_BUS_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tinythis {

    /// Handle returned by EventBus::subscribe, used to unsubscribe.
    using SubscriptionId = std::uint64_t;

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The JobQueue publishes events from events.hpp whenever a job
     * changes state. Front-ends (console progress printer, TUI log, tests)
     * subscribe to the event types they care about. A subscriber whose
     * handler captures `this` must unsubscribe before it is destroyed.
     *
     * Events are delivered synchronously on the publishing thread. The
     * queue only publishes from the thread that calls JobQueue::poll, so
     * subscribers never run on the encoder worker.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., JobFinishedEvent).
         * @param handler Invoked with a const reference to each published event.
         * @return Handle for unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            handlers_[std::type_index(typeid(Event))].emplace_back(
                id, [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
            return id;
        }

        /**
         * @brief Removes one subscription. Unknown ids are ignored.
         *
         * A publish already in progress on another thread may still call
         * the handler once.
         */
        void unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, list] : handlers_) {
                std::erase_if(list, [id](const auto& entry) { return entry.first == id; });
            }
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         *
         * Handlers are copied out under the lock and invoked without it,
         * so a handler may subscribe or publish in turn.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = handlers_.find(std::type_index(typeid(Event)));
                if (it == handlers_.end()) {
                    return;
                }
                targets.reserve(it->second.size());
                for (const auto& entry : it->second) {
                    targets.push_back(entry.second);
                }
            }
            for (const auto& fn : targets) {
                fn(&event);
            }
        }

        /// Drops every subscription.
        void clear() {
            std::lock_guard lock(mtx_);
            handlers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;

        std::unordered_map<std::type_index, std::vector<std::pair<SubscriptionId, Callback>>> handlers_;
        SubscriptionId last_id_ = 0;
        std::mutex mtx_;
    };

} // namespace tinythis

#endif // TINYTHIS_EVENT_BUS_HPP
