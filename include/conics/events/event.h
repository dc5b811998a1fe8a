#pragma once
/**
 * @file event.h
 * @brief Engine event types and payloads
 *
 * Events report what happened during a tick: frame transitions, collision
 * guards, truncated predictions and numeric trouble. They are plain values
 * and carry everything a handler needs.
 */

#include "conics/core/types.h"
#include "conics/orbital/elements.h"
#include <functional>
#include <string>
#include <variant>

namespace conics::events {

// ============================================================================
// Event Categories
// ============================================================================

enum class EventCategory : UInt32 {
    None        = 0,
    System      = 1 << 0,   ///< Lifecycle and time stepping
    Orbital     = 1 << 1,   ///< Frame transitions and flybys
    Diagnostic  = 1 << 2,   ///< Numeric failures and truncation
    User        = 1 << 3,
    All         = 0xFFFFFFFF
};

inline EventCategory operator|(EventCategory a, EventCategory b) {
    return static_cast<EventCategory>(static_cast<UInt32>(a) | static_cast<UInt32>(b));
}

inline EventCategory operator&(EventCategory a, EventCategory b) {
    return static_cast<EventCategory>(static_cast<UInt32>(a) & static_cast<UInt32>(b));
}

inline bool has_category(EventCategory mask, EventCategory category) {
    return (static_cast<UInt32>(mask) & static_cast<UInt32>(category)) != 0;
}

// ============================================================================
// Event Types
// ============================================================================

enum class EventType : UInt32 {
    // System Events (0-99)
    SimulationStarted       = 0,
    SimulationPaused        = 1,
    SimulationResumed       = 2,
    SimulationStopped       = 3,
    TimeStepCompleted       = 4,
    AdvanceRejected         = 5,

    // Orbital Events (100-199)
    SoiEntry                = 100,
    SoiExit                 = 101,
    CollisionAvoided        = 102,
    ExtremeFlyby            = 103,

    // Diagnostic Events (200-299)
    TrajectoryTruncated     = 200,
    NumericDivergence       = 201,
    NonFiniteState          = 202,

    // User-Defined Events (1000+)
    UserDefined             = 1000
};

EventCategory get_event_category(EventType type);

const char* get_event_type_name(EventType type);

enum class EventPriority : UInt8 {
    Immediate   = 0,
    High        = 1,
    Normal      = 2,
    Low         = 3,
    Deferred    = 4
};

// ============================================================================
// Event Data Structures
// ============================================================================

struct EventBase {
    EventType type{EventType::UserDefined};
    EventPriority priority{EventPriority::Normal};
    Real timestamp{0.0};                    ///< Simulation time, Julian date
    UInt64 tick{0};                         ///< Tick counter when raised
    ShipId source_ship{INVALID_SHIP_ID};
    bool consumed{false};
};

/**
 * @brief Completed time step
 */
struct StepEventData {
    Real requested_dt{0.0};     ///< Days, before time scaling
    Real simulated_dt{0.0};     ///< Days actually advanced
    SizeT ships_advanced{0};
};

/**
 * @brief Sphere-of-influence entry or exit
 *
 * Positions and velocities are heliocentric.
 */
struct SoiEventData {
    std::string ship_name;
    BodyId body{INVALID_BODY_ID};
    std::string body_name;
    Vec3 position_before{Vec3::Zero()};
    Vec3 position_after{Vec3::Zero()};
    Vec3 velocity{Vec3::Zero()};
    Real eccentricity{0.0};
    orbital::OrbitType orbit_type{orbital::OrbitType::Elliptic};
    bool extreme{false};        ///< Straight-line fallback active
};

/**
 * @brief Periapsis raised to the safe radius of a body
 */
struct CollisionEventData {
    std::string ship_name;
    BodyId body{INVALID_BODY_ID};
    std::string body_name;
    Real periapsis_before{0.0};     ///< AU
    Real safe_radius{0.0};          ///< AU
    Real position_shift{0.0};       ///< AU
};

/**
 * @brief Numeric trouble or an early stop
 */
struct DiagnosticEventData {
    std::string ship_name;
    std::string reason;
    Real value{0.0};
};

struct UserEventData {
    UInt32 user_type_id{0};
    std::string user_type_name;
};

using EventData = std::variant<
    std::monostate,
    StepEventData,
    SoiEventData,
    CollisionEventData,
    DiagnosticEventData,
    UserEventData
>;

// ============================================================================
// Event Structure
// ============================================================================

struct Event {
    EventBase base;
    EventData data;

    EventType type() const { return base.type; }
    EventPriority priority() const { return base.priority; }
    Real timestamp() const { return base.timestamp; }
    ShipId source() const { return base.source_ship; }
    bool is_consumed() const { return base.consumed; }

    void consume() { base.consumed = true; }

    EventCategory category() const { return get_event_category(base.type); }

    template<typename T>
    bool has_data() const {
        return std::holds_alternative<T>(data);
    }

    /**
     * @throws std::bad_variant_access if type doesn't match
     */
    template<typename T>
    const T& get_data() const {
        return std::get<T>(data);
    }

    template<typename T>
    const T* try_get_data() const {
        return std::get_if<T>(&data);
    }

    static Event create_system(EventType type, Real timestamp);
    static Event create_time_step(Real requested_dt, Real simulated_dt,
                                  SizeT ships, Real timestamp);
    static Event create_soi_transition(EventType type, ShipId ship, SoiEventData data,
                                       Real timestamp);
    static Event create_collision_avoided(ShipId ship, CollisionEventData data,
                                          Real timestamp);
    static Event create_diagnostic(EventType type, ShipId ship, const std::string& ship_name,
                                   const std::string& reason, Real value, Real timestamp);
};

// ============================================================================
// Event Handler Types
// ============================================================================

/**
 * @brief Event handler callback
 * @return true if event should continue propagating, false to stop
 */
using EventHandler = std::function<bool(Event&)>;

using EventHandlerId = UInt64;

constexpr EventHandlerId INVALID_HANDLER_ID = 0;

} // namespace conics::events
