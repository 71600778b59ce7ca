/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The engine's components never hold references to each other's state.
 * Progress, sync status, conflicts and evictions are published here and
 * whoever cares (logging, metrics, UI bindings, the engine facade)
 * subscribes without the publisher knowing.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<SyncStatusChangedEvent>([](const auto& e) { ... });
 * bus.emit(SyncStatusChangedEvent{...});
 * bus.unsubscribe(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lsync::events {

/**
 * @brief Type-safe event bus
 *
 * Each event type owns an ordered channel of subscriptions keyed by ID, so
 * handlers run in subscription order. A reverse index from ID to event type
 * lets callers unsubscribe without naming the type.
 *
 * THREAD SAFETY:
 * - Any thread may subscribe, unsubscribe or emit
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID, unique across all event types, for unsubscribe()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<ErasedHandler>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        const std::type_index type(typeid(EventType));
        channels_[type].emplace(id, std::move(erased));
        owner_.emplace(id, type);
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto owner = owner_.find(id);
        if (owner == owner_.end() || owner->second != std::type_index(typeid(EventType))) {
            return;
        }
        drop_locked(owner);
    }

    /**
     * @brief Unsubscribe without naming the event type
     *
     * Components that hold a mixed list of subscription IDs use this from
     * their destructor.
     */
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto owner = owner_.find(id);
        if (owner != owner_.end()) {
            drop_locked(owner);
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * A handler that throws is logged; remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        const auto snapshot = handlers_for(std::type_index(typeid(EventType)));
        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(std::type_index(typeid(EventType)));
        return channel == channels_.end() ? 0 : channel->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        channels_.clear();
        owner_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;
    using Channel = std::map<SubscriptionId, std::shared_ptr<const ErasedHandler>>;

    std::vector<std::shared_ptr<const ErasedHandler>> handlers_for(std::type_index type) const {
        std::vector<std::shared_ptr<const ErasedHandler>> out;
        std::shared_lock lock(mutex_);
        auto channel = channels_.find(type);
        if (channel != channels_.end()) {
            out.reserve(channel->second.size());
            for (const auto& entry : channel->second) {
                out.push_back(entry.second);
            }
        }
        return out;
    }

    void drop_locked(std::unordered_map<SubscriptionId, std::type_index>::iterator owner) {
        auto channel = channels_.find(owner->second);
        if (channel != channels_.end()) {
            channel->second.erase(owner->first);
            if (channel->second.empty()) {
                channels_.erase(channel);
            }
        }
        owner_.erase(owner);
    }

    std::unordered_map<std::type_index, Channel> channels_;
    std::unordered_map<SubscriptionId, std::type_index> owner_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace lsync::events
