/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for upload progress reporting
 *
 * The upload engine emits events without knowing who consumes them.
 * Logging and metrics subscribe to the events they care about.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<PartUploadedEvent>([](const PartUploadedEvent& e) { ... });
 * bus.emit(PartUploadedEvent{...});
 * bus.unsubscribe<PartUploadedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace archup::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Orchestrator workers emit concurrently
 * - Handlers run synchronously in the emitting thread, so they must be
 *   thread-safe themselves
 * - Handlers may subscribe or unsubscribe while an emit is in flight;
 *   the change applies from the next emit
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const Handler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(Entry{id, std::move(erased)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const Entry& entry) { return entry.id == id; }),
                      entries.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining
     * handlers still run.
     *
     * RETURNS:
     * Number of handlers that completed without throwing
     */
    template<typename EventType>
    std::size_t emit(const EventType& event) {
        std::vector<std::shared_ptr<const Handler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return 0;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.handler);
            }
        }

        std::size_t delivered = 0;
        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
                ++delivered;
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
        return delivered;
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
    using Handler = std::function<void(const void*)>;

    struct Entry {
        HandlerId id;
        std::shared_ptr<const Handler> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace archup::events
