/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef INKPRESS_EVENT_BUS_HPP
#define INKPRESS_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace inkpress {

    /**
     * @brief Type-safe publish/subscribe bus keyed by event type.
     *
     * @details The pipeline publishes progress without knowing who listens;
     * the CLI and the public facade subscribe to the event structs of
     * events.hpp. Handlers run on the publishing thread, outside the lock,
     * so a handler may itself subscribe or publish.
     */
    class EventBus {
    public:
        using SubscriptionId = std::size_t;

        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Registers @p handler for events of type @p Event.
         * @return Id to pass to unsubscribe().
         */
        template <typename Event>
        SubscriptionId subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            const SubscriptionId id = ++last_id_;
            subscribers_[std::type_index(typeid(Event))].push_back(
                {id, [h = std::move(handler)](const void* e) { h(*static_cast<const Event*>(e)); }});
            return id;
        }

        /// Removes a handler. Unknown ids are ignored.
        void unsubscribe(SubscriptionId id) {
            std::lock_guard lock(mtx_);
            for (auto& [type, entries] : subscribers_) {
                std::erase_if(entries, [id](const Entry& entry) { return entry.first == id; });
            }
        }

        /// Delivers @p event to every handler of its type, in subscription order.
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Entry> targets;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                targets = it->second;
            }
            for (const auto& entry : targets) {
                entry.second(&event);
            }
        }

    private:
        using Entry = std::pair<SubscriptionId, std::function<void(const void*)>>;

        std::unordered_map<std::type_index, std::vector<Entry>> subscribers_;
        SubscriptionId last_id_ = 0;
        mutable std::mutex mtx_;
    };

} // namespace inkpress

#endif // INKPRESS_EVENT_BUS_HPP
