#pragma once
/**
 * @file propagator.h
 * @brief Single physics step for one ship
 *
 * Composes Kepler propagation, SOI transitions, the periapsis guard and
 * sail thrust. The step is pure with respect to its arguments: the input
 * ship is never modified and a failed step returns it unchanged.
 */

#include "conics/bodies/body.h"
#include "conics/orbital/conversion.h"
#include "conics/orbital/ship.h"
#include "conics/orbital/soi.h"
#include "conics/orbital/thrust.h"
#include <optional>
#include <vector>

namespace conics::orbital {

/**
 * @brief Explicit simulation context for a call
 */
struct SimulationContext {
    Real time{0.0};                         ///< Start of the step (Julian date)
    const bodies::BodyCatalog* catalog{nullptr};
    std::vector<BodyId> soi_candidates;     ///< Bodies whose SOI is searched
};

enum class StepStatus : UInt8 {
    Ok,
    InvalidStep,        ///< dt not positive or not finite, ship unchanged
    NonFiniteState      ///< Step aborted, last known-good ship returned
};

const char* step_status_name(StepStatus status);

struct PropagatorSettings {
    SoiSettings soi;
    Real min_thrust{1e-20};
    Real sun_approach_radius{0.02};     ///< No thrust inside this heliocentric distance
};

struct StepResult {
    ShipState ship;
    StepStatus status{StepStatus::Ok};
    std::vector<Transition> transitions;
    std::optional<CollisionCorrection> collision;
    ThrustStatus thrust{ThrustStatus::BelowThreshold};
    bool thrust_attempted{false};
    bool low_confidence{false};         ///< Solver non-convergence or asymptotic clamp
    StateVector state;                  ///< Ship state at the end of the step (ship frame)
    Vec3 helio_position;
    Vec3 helio_velocity;
};

class ShipPropagator {
public:
    explicit ShipPropagator(PropagatorSettings settings = {});

    const PropagatorSettings& settings() const { return settings_; }
    const SOITransitionManager& soi() const { return soi_; }

    /**
     * @brief Advance a ship by dt days
     *
     * At most one SOI transition happens per step. Thrust is skipped on a
     * step with a transition, on a straight-line extreme flyby, and within
     * the sun-approach radius.
     *
     * @throws std::invalid_argument if ctx.catalog is null
     */
    StepResult step(const ShipState& ship, const SimulationContext& ctx, Real dt,
                    const PropulsionCommand& command) const;

    /**
     * @brief Ship state at a time without advancing it
     *
     * Uses the straight-line fallback when engaged.
     */
    PropagationResult state_at(const ShipState& ship, Real time) const;

    /**
     * @brief Heliocentric position and velocity of a ship-frame state
     */
    StateVector to_heliocentric(const StateVector& state, const bodies::BodyCatalog& catalog) const;

private:
    PropagatorSettings settings_;
    SOITransitionManager soi_;
    ThrustIntegrator thrust_;
};

} // namespace conics::orbital
