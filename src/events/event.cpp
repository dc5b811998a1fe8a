/**
 * @file event.cpp
 * @brief Event naming and factory methods
 */

#include "conics/events/event.h"

namespace conics::events {

EventCategory get_event_category(EventType type) {
    UInt32 type_val = static_cast<UInt32>(type);

    if (type_val < 100) {
        return EventCategory::System;
    } else if (type_val < 200) {
        return EventCategory::Orbital;
    } else if (type_val < 300) {
        return EventCategory::Diagnostic;
    } else if (type_val >= 1000) {
        return EventCategory::User;
    }

    return EventCategory::None;
}

const char* get_event_type_name(EventType type) {
    switch (type) {
        case EventType::SimulationStarted:      return "SimulationStarted";
        case EventType::SimulationPaused:       return "SimulationPaused";
        case EventType::SimulationResumed:      return "SimulationResumed";
        case EventType::SimulationStopped:      return "SimulationStopped";
        case EventType::TimeStepCompleted:      return "TimeStepCompleted";
        case EventType::AdvanceRejected:        return "AdvanceRejected";

        case EventType::SoiEntry:               return "SoiEntry";
        case EventType::SoiExit:                return "SoiExit";
        case EventType::CollisionAvoided:       return "CollisionAvoided";
        case EventType::ExtremeFlyby:           return "ExtremeFlyby";

        case EventType::TrajectoryTruncated:    return "TrajectoryTruncated";
        case EventType::NumericDivergence:      return "NumericDivergence";
        case EventType::NonFiniteState:         return "NonFiniteState";

        case EventType::UserDefined:            return "UserDefined";
    }
    return "Unknown";
}

// ============================================================================
// Event Factory Methods
// ============================================================================

Event Event::create_system(EventType type, Real timestamp) {
    Event event;
    event.base.type = type;
    event.base.priority = EventPriority::Normal;
    event.base.timestamp = timestamp;
    return event;
}

Event Event::create_time_step(Real requested_dt, Real simulated_dt,
                              SizeT ships, Real timestamp) {
    Event event;
    event.base.type = EventType::TimeStepCompleted;
    event.base.priority = EventPriority::Low;
    event.base.timestamp = timestamp;

    StepEventData data;
    data.requested_dt = requested_dt;
    data.simulated_dt = simulated_dt;
    data.ships_advanced = ships;
    event.data = data;

    return event;
}

Event Event::create_soi_transition(EventType type, ShipId ship, SoiEventData data,
                                   Real timestamp) {
    Event event;
    event.base.type = type;
    event.base.priority = EventPriority::High;
    event.base.timestamp = timestamp;
    event.base.source_ship = ship;
    event.data = std::move(data);
    return event;
}

Event Event::create_collision_avoided(ShipId ship, CollisionEventData data, Real timestamp) {
    Event event;
    event.base.type = EventType::CollisionAvoided;
    event.base.priority = EventPriority::Immediate;
    event.base.timestamp = timestamp;
    event.base.source_ship = ship;
    event.data = std::move(data);
    return event;
}

Event Event::create_diagnostic(EventType type, ShipId ship, const std::string& ship_name,
                               const std::string& reason, Real value, Real timestamp) {
    Event event;
    event.base.type = type;
    event.base.priority = type == EventType::NonFiniteState ? EventPriority::Immediate
                                                            : EventPriority::Normal;
    event.base.timestamp = timestamp;
    event.base.source_ship = ship;

    DiagnosticEventData data;
    data.ship_name = ship_name;
    data.reason = reason;
    data.value = value;
    event.data = data;

    return event;
}

} // namespace conics::events
