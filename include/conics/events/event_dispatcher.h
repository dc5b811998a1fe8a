#pragma once
/**
 * @file event_dispatcher.h
 * @brief Event dispatcher and event queue management
 *
 * Routes engine events to subscribed handlers. Events raised while a
 * dispatch is in progress are queued and delivered by flush_queue().
 */

#include "conics/events/event.h"
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace conics::events {

struct EventDispatcherConfig {
    SizeT max_queue_size{10000};
    SizeT max_handlers_per_type{100};
    bool enable_event_history{false};
    SizeT history_size{1000};
    bool allow_recursive_dispatch{false};
};

struct EventStatistics {
    UInt64 total_events_dispatched{0};
    UInt64 total_events_queued{0};
    UInt64 total_events_dropped{0};
    UInt64 total_handlers_called{0};

    std::unordered_map<EventType, UInt64> events_by_type;
};

/// A registered handler. Type subscriptions leave `category` at None.
struct Subscriber {
    EventHandlerId id{INVALID_HANDLER_ID};
    EventHandler handler;
    EventType type{EventType::UserDefined};
    EventCategory category{EventCategory::None};
    int order{0};                          ///< Lower runs earlier
    std::string name;
    bool enabled{true};

    bool accepts(const Event& event) const {
        return category != EventCategory::None ? has_category(category, event.category())
                                               : type == event.type();
    }
};

/**
 * @brief Central event router for an engine instance
 *
 * Usage:
 * @code
 * EventDispatcher dispatcher;
 * auto id = dispatcher.subscribe(EventType::SoiEntry,
 *     [](Event& e) {
 *         auto& data = e.get_data<SoiEventData>();
 *         return true;
 *     });
 * dispatcher.unsubscribe(id);
 * @endcode
 */
class EventDispatcher {
public:
    EventDispatcher();
    explicit EventDispatcher(const EventDispatcherConfig& config);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    EventDispatcher(EventDispatcher&&) noexcept;
    EventDispatcher& operator=(EventDispatcher&&) noexcept;

    // ========================================================================
    // Handler Registration
    // ========================================================================

    /**
     * @brief Subscribe to a specific event type
     * @return Handler ID, or INVALID_HANDLER_ID if rejected
     */
    EventHandlerId subscribe(EventType type, EventHandler handler,
                             const std::string& name = "", int order = 0);

    EventHandlerId subscribe_category(EventCategory category, EventHandler handler,
                                      const std::string& name = "", int order = 0);

    EventHandlerId subscribe_all(EventHandler handler, const std::string& name = "",
                                 int order = 0);

    bool unsubscribe(EventHandlerId id);

    void set_handler_enabled(EventHandlerId id, bool enabled);
    bool is_handler_enabled(EventHandlerId id) const;

    SizeT handler_count(EventType type) const;
    SizeT total_handler_count() const;

    // ========================================================================
    // Event Dispatching
    // ========================================================================

    /**
     * @brief Deliver an event synchronously
     *
     * Handlers run in order until one consumes the event. Called during
     * another dispatch, the event is queued instead.
     */
    void dispatch(Event& event);
    void dispatch(Event&& event);

    /**
     * @brief Queue an event for flush_queue(), ordered by priority
     * @return false if the queue is full
     */
    bool queue(Event event);

    /**
     * @brief Deliver all queued events, highest priority first
     * @return Number of events processed
     */
    SizeT flush_queue();

    void clear_queue();
    SizeT queue_size() const;
    bool queue_empty() const;

    // ========================================================================
    // Event History
    // ========================================================================

    void enable_history(bool enable);
    bool history_enabled() const;
    const std::deque<Event>& get_history() const;
    void clear_history();

    std::vector<Event> query_history(EventType type) const;
    std::vector<Event> query_history(EventCategory category) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    const EventStatistics& get_statistics() const;
    void reset_statistics();
    const EventDispatcherConfig& config() const;
    bool is_dispatching() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void deliver(Event& event);
};

// ============================================================================
// RAII Subscription Guard
// ============================================================================

/**
 * @brief Unsubscribes its handler on destruction
 */
class EventSubscription {
public:
    EventSubscription() = default;

    EventSubscription(EventDispatcher& dispatcher, EventType type,
                      EventHandler handler, const std::string& name = "");

    EventSubscription(EventDispatcher& dispatcher, EventCategory category,
                      EventHandler handler, const std::string& name = "");

    ~EventSubscription();

    EventSubscription(const EventSubscription&) = delete;
    EventSubscription& operator=(const EventSubscription&) = delete;

    EventSubscription(EventSubscription&& other) noexcept;
    EventSubscription& operator=(EventSubscription&& other) noexcept;

    /// Detach without unsubscribing
    EventHandlerId release();

    bool valid() const;
    EventHandlerId id() const;

private:
    EventDispatcher* dispatcher_{nullptr};
    EventHandlerId handler_id_{INVALID_HANDLER_ID};
};

} // namespace conics::events
