#pragma once

/// @file event_bus.hpp
/// @brief Deferred typed event bus for media_event
///
/// Events are published from any thread into a pending queue and delivered
/// on the thread that calls process():
/// - Typed subscriptions keyed by event type
/// - Priority-based delivery (event priority, then handler priority)
/// - FIFO delivery among events of equal priority

#include "fwd.hpp"
#include <media_engine/structures/blocking_queue.hpp>

#include <algorithm>
#include <any>
#include <compare>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <typeindex>
#include <vector>

namespace media_event {

// =============================================================================
// Priority
// =============================================================================

/// Event priority for ordering delivery
enum class Priority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

// =============================================================================
// SubscriberId
// =============================================================================

/// Unique identifier for a subscription
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// =============================================================================
// EventEnvelope
// =============================================================================

/// Type-erased event plus delivery metadata
class EventEnvelope {
public:
    /// Event type identifier
    std::type_index type_id;
    /// Event data (type-erased)
    std::any data;
    /// Event priority
    Priority priority;
    /// Bus timestamp when published
    std::uint64_t timestamp;

    /// Create envelope from typed event
    template<typename E>
    static EventEnvelope create(E&& event, Priority prio, std::uint64_t ts) {
        EventEnvelope env;
        env.type_id = std::type_index(typeid(std::decay_t<E>));
        env.data = std::forward<E>(event);
        env.priority = prio;
        env.timestamp = ts;
        return env;
    }

    /// Try to get the event as a specific type
    template<typename E>
    [[nodiscard]] const E* try_get() const {
        return std::any_cast<E>(&data);
    }

private:
    EventEnvelope() : type_id(typeid(void)), priority(Priority::Normal), timestamp(0) {}
};

// =============================================================================
// EventBus
// =============================================================================

/// Dynamic handler type
using DynamicHandler = std::function<void(const std::any&)>;

/// Event bus for publishing and subscribing to events
class EventBus {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create a new event bus
    EventBus() : m_next_subscriber_id(1), m_timestamp(0) {}

    // Non-copyable, non-movable (queue owns a mutex)
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Publish an event with default (Normal) priority
    template<typename E>
    void publish(E&& event) {
        publish_with_priority(std::forward<E>(event), Priority::Normal);
    }

    /// Publish an event with specified priority
    template<typename E>
    void publish_with_priority(E&& event, Priority priority) {
        m_queue.push(EventEnvelope::create(
            std::forward<E>(event),
            priority,
            m_timestamp.load(std::memory_order_relaxed)));
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to an event type with default (Normal) priority
    template<typename E, typename F>
    SubscriberId subscribe(F&& handler) {
        return subscribe_with_priority<E>(std::forward<F>(handler), Priority::Normal);
    }

    /// Subscribe to an event type with specified priority
    template<typename E, typename F>
    SubscriberId subscribe_with_priority(F&& handler, Priority priority) {
        std::lock_guard lock(m_handlers_mutex);

        SubscriberId sub_id(m_next_subscriber_id++);

        DynamicHandler wrapped = [h = std::forward<F>(handler)](const std::any& data) {
            if (const E* event = std::any_cast<E>(&data)) {
                h(*event);
            }
        };

        auto& handlers = m_handlers[std::type_index(typeid(E))];
        handlers.push_back(std::make_shared<HandlerEntry>(HandlerEntry{sub_id, priority, std::move(wrapped)}));

        // Higher priority first, subscription order within a priority
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const auto& a, const auto& b) {
                return static_cast<int>(a->priority) > static_cast<int>(b->priority);
            });

        return sub_id;
    }

    /// Unsubscribe from events. Safe to call from inside a handler.
    void unsubscribe(SubscriberId id) {
        std::lock_guard lock(m_handlers_mutex);

        for (auto& [type_id, handlers] : m_handlers) {
            handlers.erase(
                std::remove_if(handlers.begin(), handlers.end(),
                    [id](const auto& entry) { return entry->id == id; }),
                handlers.end());
        }
    }

    /// Number of live subscriptions for an event type
    template<typename E>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(m_handlers_mutex);
        auto it = m_handlers.find(std::type_index(typeid(E)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Deliver all pending events
    /// @return Number of events delivered
    std::size_t process() {
        return dispatch(m_queue.drain());
    }

    /// Deliver up to max_events pending events
    /// @return Number of events delivered
    std::size_t process_batch(std::size_t max_events) {
        std::vector<EventEnvelope> events;
        events.reserve(max_events);
        for (std::size_t i = 0; i < max_events; ++i) {
            auto envelope = m_queue.try_pop();
            if (!envelope) break;
            events.push_back(std::move(*envelope));
        }
        return dispatch(std::move(events));
    }

    // =========================================================================
    // Queue Management
    // =========================================================================

    /// Clear all pending events without processing
    void clear() {
        m_queue.clear();
    }

    /// Get pending event count (approximate)
    [[nodiscard]] std::size_t pending_count() const {
        return m_queue.size();
    }

    /// Check if there are pending events
    [[nodiscard]] bool has_pending() const {
        return !m_queue.empty();
    }

    /// Get current timestamp
    [[nodiscard]] std::uint64_t timestamp() const noexcept {
        return m_timestamp.load(std::memory_order_relaxed);
    }

private:
    struct HandlerEntry {
        SubscriberId id;
        Priority priority;
        DynamicHandler handler;
    };
    using HandlerList = std::vector<std::shared_ptr<HandlerEntry>>;

    std::size_t dispatch(std::vector<EventEnvelope> events) {
        std::stable_sort(events.begin(), events.end(),
            [](const EventEnvelope& a, const EventEnvelope& b) {
                return static_cast<int>(a.priority) > static_cast<int>(b.priority);
            });

        // Handlers run without the lock held so they may publish, subscribe
        // or unsubscribe. Events they publish are delivered on the next call.
        for (const auto& envelope : events) {
            HandlerList snapshot;
            {
                std::lock_guard lock(m_handlers_mutex);
                auto it = m_handlers.find(envelope.type_id);
                if (it == m_handlers.end()) continue;
                snapshot = it->second;
            }
            for (const auto& entry : snapshot) {
                if (is_subscribed(entry->id)) {
                    entry->handler(envelope.data);
                }
            }
        }

        m_timestamp.fetch_add(1, std::memory_order_relaxed);
        return events.size();
    }

    bool is_subscribed(SubscriberId id) const {
        std::lock_guard lock(m_handlers_mutex);
        for (const auto& [type_id, handlers] : m_handlers) {
            for (const auto& entry : handlers) {
                if (entry->id == id) return true;
            }
        }
        return false;
    }

    media_structures::BlockingQueue<EventEnvelope> m_queue;
    std::map<std::type_index, HandlerList> m_handlers;
    mutable std::mutex m_handlers_mutex;
    std::uint64_t m_next_subscriber_id;
    std::atomic<std::uint64_t> m_timestamp;
};

} // namespace media_event
