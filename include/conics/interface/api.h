#pragma once
/**
 * @file api.h
 * @brief Public C++ API for Conics
 */

#include "conics/bodies/body.h"
#include "conics/events/event_dispatcher.h"
#include "conics/interface/config.h"
#include "conics/orbital/gravity_assist.h"
#include "conics/orbital/intersection.h"
#include "conics/orbital/prediction.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conics {

class EngineImpl;

/**
 * @brief Outcome of Engine::advance
 */
enum class AdvanceResult : UInt8 {
    Ok,
    NotInitialized,
    Paused,             ///< Paused, stopped, or time scale zero; nothing advanced
    InvalidStep,        ///< dt not positive or not finite
    Reentrant,          ///< Called from inside another advance; rejected without side effects
    NonFiniteState      ///< Time advanced but at least one ship kept its last good state
};

const char* advance_result_name(AdvanceResult result);

/**
 * @brief Main engine facade
 *
 * Owns the clock, the body catalog, the ships and their query caches.
 * advance() is the single entry point that moves simulation time.
 */
class Engine {
public:
    Engine();
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    Engine(Engine&&) noexcept;
    Engine& operator=(Engine&&) noexcept;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Initialize from an XML configuration file
     *
     * Falls back to defaults, and logs, if the file cannot be loaded.
     */
    bool initialize(const std::string& config_path);

    bool initialize();
    bool initialize(const config::EngineConfig& config);

    void shutdown();

    bool is_initialized() const;

    const config::EngineConfig& get_config() const;

    // ========================================================================
    // Simulation Control
    // ========================================================================

    /**
     * @brief Advance all ships by dt days (scaled by the time scale)
     *
     * Ships are stepped against the state at the start of the tick; events
     * are delivered after every ship has been committed.
     */
    AdvanceResult advance(Real dt);

    void start();
    void pause();
    void resume();
    void stop();

    SimulationState get_state() const;

    // ========================================================================
    // Time Management
    // ========================================================================

    Real get_time() const;
    Real get_time_scale() const;
    void set_time_scale(Real scale);

    /**
     * @brief Jump the clock; ships keep their orbits
     */
    void set_time(Real julian_date);

    // ========================================================================
    // Bodies
    // ========================================================================

    const bodies::BodyCatalog& get_bodies() const;
    void set_bodies(bodies::BodyCatalog catalog);

    /**
     * @brief Bodies whose SOIs are searched; defaults to every body with an SOI
     */
    void set_soi_candidates(std::vector<BodyId> bodies);
    const std::vector<BodyId>& get_soi_candidates() const;

    // ========================================================================
    // Ships
    // ========================================================================

    ShipId add_ship(orbital::ShipState ship);

    /**
     * @brief Add a ship from a <ship> XML definition
     * @return INVALID_SHIP_ID on failure
     */
    ShipId add_ship(const std::string& xml_path);

    bool remove_ship(ShipId id);
    bool ship_exists(ShipId id) const;
    std::vector<ShipId> get_ship_ids() const;

    /**
     * @throws std::out_of_range for an unknown id
     */
    const orbital::ShipState& get_ship(ShipId id) const;

    orbital::StateVector get_ship_state(ShipId id) const;
    orbital::StateVector get_ship_heliocentric_state(ShipId id) const;

    void set_propulsion(ShipId id, const orbital::PropulsionCommand& command);
    orbital::PropulsionCommand get_propulsion(ShipId id) const;

    /**
     * @brief Result of the ship's most recent completed hyperbolic flyby
     */
    std::optional<orbital::GravityAssistResult> get_last_flyby(ShipId id) const;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Cached trajectory prediction
     * @param start_time Planning time; defaults to the current time
     */
    std::shared_ptr<const orbital::Trajectory> predict_trajectory(
        ShipId id, Real duration_days = 0.0, std::optional<Real> start_time = std::nullopt);

    std::shared_ptr<const orbital::IntersectionReport> detect_intersections(
        ShipId id, Real duration_days = 0.0, std::optional<Real> start_time = std::nullopt);

    orbital::GravityAssistResult analyze_gravity_assist(const orbital::StateVector& entry,
                                                        const orbital::StateVector& exit,
                                                        Real mu) const;

    void invalidate_caches();

    // ========================================================================
    // Events
    // ========================================================================

    events::EventDispatcher& get_event_dispatcher();

private:
    std::unique_ptr<EngineImpl> impl_;
};

} // namespace conics
