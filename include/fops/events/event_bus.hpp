/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between operation workers and the host
 *
 * WHY THIS FILE EXISTS:
 * Operation workers publish progress, conflicts and terminal results
 * without knowing whether a dialog, the CLI or a test is listening.
 *
 * DELIVERY RULES:
 * - Handlers run synchronously on the emitting (worker) thread
 * - Handlers registered for one event type never see another type
 * - A handler that throws is logged and skipped; the worker keeps going
 * - Handlers may subscribe or unsubscribe from inside a callback
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<OperationProgressEvent>([](const OperationProgressEvent& e) { ... });
 * bus.emit(OperationProgressEvent{...});
 * bus.unsubscribe<OperationProgressEvent>(id);
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fops::events {

using SubscriptionId = std::size_t;

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register `handler` for every future EventType
     *
     * RETURNS: id to pass to unsubscribe<EventType>()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Slot slot;
        slot.invoke = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        slot.id = id;
        slots_[key<EventType>()].push_back(std::move(slot));
        return id;
    }

    /// RETURNS: true if a handler was removed
    template<typename EventType>
    bool unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        if (found == slots_.end()) {
            return false;
        }
        auto& slots = found->second;
        const auto before = slots.size();
        slots.erase(std::remove_if(slots.begin(), slots.end(),
                                   [id](const Slot& slot) { return slot.id == id; }),
                    slots.end());
        return slots.size() != before;
    }

    /**
     * @brief Deliver `event` to the current EventType handlers
     *
     * The handler list is snapshotted under a shared lock and invoked
     * without it, so handlers may touch the bus themselves.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<Slot> targets;
        {
            std::shared_lock lock(mutex_);
            auto found = slots_.find(key<EventType>());
            if (found == slots_.end() || found->second.empty()) {
                return;
            }
            targets = found->second;
        }

        for (const auto& slot : targets) {
            try {
                slot.invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler failed event={} subscription={} error={}",
                              typeid(EventType).name(), slot.id, e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        return found == slots_.end() ? 0 : found->second.size();
    }

    /// Drop every handler of every type
    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        SubscriptionId id = 0;
        std::function<void(const void*)> invoke;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    SubscriptionId next_id_ = 0;
};

} // namespace fops::events
