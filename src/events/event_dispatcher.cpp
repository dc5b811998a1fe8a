/**
 * @file event_dispatcher.cpp
 * @brief Event dispatcher implementation
 */

#include "conics/events/event_dispatcher.h"
#include <algorithm>
#include <iterator>

namespace conics::events {

namespace {

struct QueuedEvent {
    Event event;
    UInt64 sequence{0};
};

// Max-heap comparator: urgent priorities surface first, then arrival order
bool queued_after(const QueuedEvent& a, const QueuedEvent& b) {
    auto pa = static_cast<UInt8>(a.event.priority());
    auto pb = static_cast<UInt8>(b.event.priority());
    if (pa != pb) {
        return pa > pb;
    }
    return a.sequence > b.sequence;
}

} // namespace

struct EventDispatcher::Impl {
    EventDispatcherConfig config;

    std::vector<Subscriber> subscribers;    // sorted by order, stable
    EventHandlerId next_id{1};

    std::vector<QueuedEvent> pending;
    UInt64 next_sequence{0};

    std::deque<Event> history;
    bool recording{false};

    EventStatistics stats;
    int depth{0};

    EventHandlerId insert(Subscriber sub) {
        sub.id = next_id++;
        auto pos = std::upper_bound(subscribers.begin(), subscribers.end(), sub.order,
            [](int order, const Subscriber& s) { return order < s.order; });
        EventHandlerId id = sub.id;
        subscribers.insert(pos, std::move(sub));
        return id;
    }

    Subscriber* find(EventHandlerId id) {
        auto it = std::find_if(subscribers.begin(), subscribers.end(),
            [id](const Subscriber& s) { return s.id == id; });
        return it == subscribers.end() ? nullptr : &*it;
    }

    const Subscriber* find(EventHandlerId id) const {
        return const_cast<Impl*>(this)->find(id);
    }

    void record(const Event& event) {
        if (!recording || config.history_size == 0) {
            return;
        }
        while (history.size() >= config.history_size) {
            history.pop_front();
        }
        history.push_back(event);
    }

    template <typename Pred>
    std::vector<Event> collect(Pred pred) const {
        std::vector<Event> out;
        std::copy_if(history.begin(), history.end(), std::back_inserter(out), pred);
        return out;
    }
};

namespace {

// Marks the dispatcher busy for the lifetime of one delivery
class DeliveryScope {
public:
    explicit DeliveryScope(int& depth) : depth_(depth) { ++depth_; }
    ~DeliveryScope() { --depth_; }

    DeliveryScope(const DeliveryScope&) = delete;
    DeliveryScope& operator=(const DeliveryScope&) = delete;

private:
    int& depth_;
};

} // namespace

EventDispatcher::EventDispatcher()
    : EventDispatcher(EventDispatcherConfig{}) {
}

EventDispatcher::EventDispatcher(const EventDispatcherConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->recording = config.enable_event_history;
}

EventDispatcher::~EventDispatcher() = default;

EventDispatcher::EventDispatcher(EventDispatcher&&) noexcept = default;
EventDispatcher& EventDispatcher::operator=(EventDispatcher&&) noexcept = default;

// ============================================================================
// Handler Registration
// ============================================================================

EventHandlerId EventDispatcher::subscribe(EventType type, EventHandler handler,
                                          const std::string& name, int order) {
    if (!handler || handler_count(type) >= impl_->config.max_handlers_per_type) {
        return INVALID_HANDLER_ID;
    }

    Subscriber sub;
    sub.handler = std::move(handler);
    sub.type = type;
    sub.order = order;
    sub.name = name;
    return impl_->insert(std::move(sub));
}

EventHandlerId EventDispatcher::subscribe_category(EventCategory category,
                                                   EventHandler handler,
                                                   const std::string& name,
                                                   int order) {
    if (!handler || category == EventCategory::None) {
        return INVALID_HANDLER_ID;
    }

    Subscriber sub;
    sub.handler = std::move(handler);
    sub.category = category;
    sub.order = order;
    sub.name = name;
    return impl_->insert(std::move(sub));
}

EventHandlerId EventDispatcher::subscribe_all(EventHandler handler,
                                              const std::string& name,
                                              int order) {
    return subscribe_category(EventCategory::All, std::move(handler), name, order);
}

bool EventDispatcher::unsubscribe(EventHandlerId id) {
    auto& subs = impl_->subscribers;
    auto removed = std::remove_if(subs.begin(), subs.end(),
        [id](const Subscriber& s) { return s.id == id; });
    if (id == INVALID_HANDLER_ID || removed == subs.end()) {
        return false;
    }
    subs.erase(removed, subs.end());
    return true;
}

void EventDispatcher::set_handler_enabled(EventHandlerId id, bool enabled) {
    if (Subscriber* sub = impl_->find(id)) {
        sub->enabled = enabled;
    }
}

bool EventDispatcher::is_handler_enabled(EventHandlerId id) const {
    const Subscriber* sub = impl_->find(id);
    return sub != nullptr && sub->enabled;
}

SizeT EventDispatcher::handler_count(EventType type) const {
    return static_cast<SizeT>(std::count_if(
        impl_->subscribers.begin(), impl_->subscribers.end(),
        [type](const Subscriber& s) {
            return s.category == EventCategory::None && s.type == type;
        }));
}

SizeT EventDispatcher::total_handler_count() const {
    return impl_->subscribers.size();
}

// ============================================================================
// Event Dispatching
// ============================================================================

void EventDispatcher::deliver(Event& event) {
    // Handlers may (un)subscribe while running
    const std::vector<Subscriber> targets = impl_->subscribers;
    for (const auto& sub : targets) {
        if (!sub.enabled || !sub.accepts(event)) {
            continue;
        }
        impl_->stats.total_handlers_called++;
        if (!sub.handler(event) || event.is_consumed()) {
            return;
        }
    }
}

void EventDispatcher::dispatch(Event& event) {
    if (impl_->depth > 0 && !impl_->config.allow_recursive_dispatch) {
        queue(event);
        return;
    }

    {
        DeliveryScope scope(impl_->depth);
        deliver(event);
    }

    impl_->stats.total_events_dispatched++;
    impl_->stats.events_by_type[event.type()]++;
    impl_->record(event);
}

void EventDispatcher::dispatch(Event&& event) {
    Event local = std::move(event);
    dispatch(local);
}

// ============================================================================
// Event Queue
// ============================================================================

bool EventDispatcher::queue(Event event) {
    auto& pending = impl_->pending;
    if (pending.size() >= impl_->config.max_queue_size) {
        impl_->stats.total_events_dropped++;
        return false;
    }

    pending.push_back(QueuedEvent{std::move(event), impl_->next_sequence++});
    std::push_heap(pending.begin(), pending.end(), queued_after);
    impl_->stats.total_events_queued++;
    return true;
}

SizeT EventDispatcher::flush_queue() {
    auto& pending = impl_->pending;
    SizeT delivered = 0;
    for (; !pending.empty(); ++delivered) {
        std::pop_heap(pending.begin(), pending.end(), queued_after);
        Event next = std::move(pending.back().event);
        pending.pop_back();
        dispatch(next);
    }
    return delivered;
}

void EventDispatcher::clear_queue() {
    impl_->pending.clear();
}

SizeT EventDispatcher::queue_size() const {
    return impl_->pending.size();
}

bool EventDispatcher::queue_empty() const {
    return impl_->pending.empty();
}

// ============================================================================
// Event History
// ============================================================================

void EventDispatcher::enable_history(bool enable) {
    impl_->recording = enable;
    if (!enable) {
        impl_->history.clear();
    }
}

bool EventDispatcher::history_enabled() const {
    return impl_->recording;
}

const std::deque<Event>& EventDispatcher::get_history() const {
    return impl_->history;
}

void EventDispatcher::clear_history() {
    impl_->history.clear();
}

std::vector<Event> EventDispatcher::query_history(EventType type) const {
    return impl_->collect([type](const Event& e) { return e.type() == type; });
}

std::vector<Event> EventDispatcher::query_history(EventCategory category) const {
    return impl_->collect([category](const Event& e) {
        return has_category(e.category(), category);
    });
}

// ============================================================================
// Statistics
// ============================================================================

const EventStatistics& EventDispatcher::get_statistics() const {
    return impl_->stats;
}

void EventDispatcher::reset_statistics() {
    impl_->stats = EventStatistics{};
}

const EventDispatcherConfig& EventDispatcher::config() const {
    return impl_->config;
}

bool EventDispatcher::is_dispatching() const {
    return impl_->depth > 0;
}

// ============================================================================
// EventSubscription
// ============================================================================

EventSubscription::EventSubscription(EventDispatcher& dispatcher, EventType type,
                                     EventHandler handler, const std::string& name)
    : dispatcher_(&dispatcher)
    , handler_id_(dispatcher.subscribe(type, std::move(handler), name)) {
}

EventSubscription::EventSubscription(EventDispatcher& dispatcher, EventCategory category,
                                     EventHandler handler, const std::string& name)
    : dispatcher_(&dispatcher)
    , handler_id_(dispatcher.subscribe_category(category, std::move(handler), name)) {
}

EventSubscription::~EventSubscription() {
    if (valid()) {
        dispatcher_->unsubscribe(handler_id_);
    }
}

EventSubscription::EventSubscription(EventSubscription&& other) noexcept
    : dispatcher_(other.dispatcher_)
    , handler_id_(other.release()) {
}

EventSubscription& EventSubscription::operator=(EventSubscription&& other) noexcept {
    if (this != &other) {
        if (valid()) {
            dispatcher_->unsubscribe(handler_id_);
        }
        dispatcher_ = other.dispatcher_;
        handler_id_ = other.release();
    }
    return *this;
}

EventHandlerId EventSubscription::release() {
    EventHandlerId id = handler_id_;
    dispatcher_ = nullptr;
    handler_id_ = INVALID_HANDLER_ID;
    return id;
}

bool EventSubscription::valid() const {
    return dispatcher_ != nullptr && handler_id_ != INVALID_HANDLER_ID;
}

EventHandlerId EventSubscription::id() const {
    return handler_id_;
}

} // namespace conics::events
