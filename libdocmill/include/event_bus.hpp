/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef DOCMILL_EVENT_BUS_HPP
#define DOCMILL_EVENT_BUS_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docmill {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details BatchExecutor publishes per-file progress events without
     * knowing who listens; the CLI, the tests and the DocMill observer
     * bridge subscribe to the event types they care about.
     *
     * Handlers run under the bus mutex, so they are serialized even when
     * files finish on different worker threads. A handler must not call
     * back into the same bus.
     */
    class EventBus {
    public:
        /// Handle returned by subscribe(), accepted by unsubscribe().
        using SubscriptionId = std::size_t;

        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileProcessCompleteEvent).
         * @param handler Function invoked with a const reference to each published event.
         * @return Handle identifying this subscription.
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            slots_[std::type_index(typeid(Event))].push_back(Slot{
                id,
                [h = std::move(handler)](const void* e) { h(*static_cast<const Event*>(e)); }
            });
            return id;
        }

        /**
         * @brief Removes a subscription. Unknown handles are ignored.
         * @return True if a handler was removed.
         */
        bool unsubscribe(const SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, slots] : slots_) {
                const auto removed = std::erase_if(slots, [id](const Slot& s) { return s.id == id; });
                if (removed > 0) return true;
            }
            return false;
        }

        /**
         * @brief Publish an event to all subscribers of its type, in subscription order.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = slots_.find(std::type_index(typeid(Event)));
            if (it == slots_.end()) return;
            for (const auto& slot : it->second) {
                slot.fn(&event);
            }
        }

        /// @return Number of handlers subscribed to `Event`.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = slots_.find(std::type_index(typeid(Event)));
            return it == slots_.end() ? 0 : it->second.size();
        }

    private:
        struct Slot {
            SubscriptionId id;
            std::function<void(const void*)> fn;   ///< Type-erased handler
        };

        std::unordered_map<std::type_index, std::vector<Slot>> slots_;
        SubscriptionId last_id_ = 0;
        mutable std::mutex mtx_;
    };

} // namespace docmill

#endif // DOCMILL_EVENT_BUS_HPP
