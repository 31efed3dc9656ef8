/**
 * @file event_bus.hpp
 * @brief Thread-safe typed publish/subscribe bus for pipeline progress.
 */

#ifndef MENDER_EVENT_BUS_HPP
#define MENDER_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mender {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details Publishers (the RecoveryPipeline) broadcast events without
     * knowing who listens; front ends subscribe per event type. Handlers are
     * copied out of the lock before they run, so a handler may itself
     * publish or subscribe. Handlers run on the publishing thread.
     */
    class EventBus {
    public:
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            handlers_[std::type_index(typeid(Event))].push_back(
                [h = std::move(handler)](const void* e) { h(*static_cast<const Event*>(e)); });
        }

        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> snapshot;
            {
                std::lock_guard lock(mtx_);
                const auto it = handlers_.find(std::type_index(typeid(Event)));
                if (it == handlers_.end()) return;
                snapshot = it->second;
            }
            for (const auto& fn : snapshot) {
                fn(&event);
            }
        }

        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            return it == handlers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> handlers_;
        mutable std::mutex mtx_;
    };

} // namespace mender

#endif // MENDER_EVENT_BUS_HPP
