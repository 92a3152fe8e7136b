/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus between the controller and observers
 *
 * The controller emits progress and outcome events without knowing who
 * listens; the logger component, the CLI status journal and tests subscribe.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<BatchConfirmedEvent>([](const BatchConfirmedEvent& e) { ... });
 * bus.emit(BatchConfirmedEvent{...});
 * bus.unsubscribe<BatchConfirmedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace upsync::events {

/**
 * @brief Synchronous event bus keyed by event type
 *
 * THREAD SAFETY:
 * - Every member may be called concurrently from any thread
 * - Handlers run on the emitting thread with no bus lock held, so a
 *   handler may subscribe, unsubscribe or emit in turn. A handler added
 *   during an emit sees the next event, not the current one.
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> handler) {
        auto call = std::make_shared<const Erased>([fn = std::move(handler)](const void* event) {
            fn(*static_cast<const Event*>(event));
        });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        slots_[key<Event>()].push_back(Slot{id, std::move(call)});
        return id;
    }

    /// Unknown ids are ignored
    template<typename Event>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = slots_.find(key<Event>());
        if (found == slots_.end()) {
            return;
        }
        auto& slots = found->second;
        slots.erase(std::remove_if(slots.begin(), slots.end(), [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
    }

    /**
     * @brief Deliver @p event to the subscribers of its type, in subscription order
     *
     * A handler that throws is logged; the remaining handlers still run.
     */
    template<typename Event>
    void emit(const Event& event) const {
        std::vector<std::shared_ptr<const Erased>> targets;
        {
            std::shared_lock lock(mutex_);
            auto found = slots_.find(key<Event>());
            if (found == slots_.end()) {
                return;
            }
            targets.reserve(found->second.size());
            for (const auto& slot : found->second) {
                targets.push_back(slot.call);
            }
        }

        for (const auto& call : targets) {
            try {
                (*call)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler for {} threw: {}", typeid(Event).name(), e.what());
            }
        }
    }

    template<typename Event>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = slots_.find(key<Event>());
        return found == slots_.end() ? 0 : found->second.size();
    }

private:
    using Erased = std::function<void(const void*)>;

    struct Slot {
        SubscriptionId id;
        std::shared_ptr<const Erased> call;
    };

    template<typename Event>
    static std::type_index key() {
        return std::type_index(typeid(Event));
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    SubscriptionId last_id_ = 0;
};

} // namespace upsync::events
