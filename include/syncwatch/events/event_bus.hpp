/**
 * @file event_bus.hpp
 * @brief Type-safe event bus behind the client's subscription channels
 *
 * WHY THIS FILE EXISTS:
 * A client has several independent listener channels (snapshots, state
 * changes, errors, heartbeats). Each channel is an event type on one bus,
 * so consumers subscribe without the client knowing who listens.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<SnapshotReceivedEvent>([](const auto& e) { ... });
 * bus.emit(SnapshotReceivedEvent{...});
 * bus.unsubscribe<SnapshotReceivedEvent>(id);
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
#include <unordered_map>
#include <utility>
#include <vector>

namespace syncwatch::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, in subscription order
 * - Handlers may subscribe or unsubscribe while being called
 *
 * A handler that throws is logged and skipped; the remaining handlers
 * still receive the event.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        SubscriptionId handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    /// Returns false when no handler with this id was registered
    template<typename EventType>
    bool unsubscribe(SubscriptionId handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return false;
        }

        auto& handler_list = it->second;
        const auto before = handler_list.size();
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end()
        );
        return handler_list.size() != before;
    }

    template<typename EventType>
    void emit(const EventType& event) {
        // Copy so handlers can (un)subscribe without deadlocking
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    // event type -> (handler_id, handler) in subscription order
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<SubscriptionId, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    SubscriptionId next_handler_id_ = 0;
};

} // namespace syncwatch::events
