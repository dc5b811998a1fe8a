/**
 * @file propagator.cpp
 * @brief Ship physics step
 */

#include "conics/orbital/propagator.h"
#include "conics/orbital/conversion.h"
#include "conics/core/logger.h"
#include <cmath>
#include <stdexcept>

namespace conics::orbital {

const char* step_status_name(StepStatus status)
{
    switch (status) {
        case StepStatus::Ok:             return "ok";
        case StepStatus::InvalidStep:    return "invalid-step";
        case StepStatus::NonFiniteState: return "non-finite-state";
    }
    return "unknown";
}

ShipPropagator::ShipPropagator(PropagatorSettings settings)
    : settings_(settings)
    , soi_(settings.soi)
    , thrust_(settings.min_thrust)
{
}

PropagationResult ShipPropagator::state_at(const ShipState& ship, Real time) const
{
    if (ship.extreme_flyby && !ship.frame.is_heliocentric()) {
        PropagationResult result;
        result.state.position = ship.extreme_flyby->position_at(time);
        result.state.velocity = ship.extreme_flyby->entry_velocity;
        result.state.frame = ship.frame;
        result.state.time = time;
        result.valid = result.state.is_finite();
        return result;
    }
    return propagate(ship.elements, time, ship.frame);
}

StateVector ShipPropagator::to_heliocentric(const StateVector& state,
                                            const bodies::BodyCatalog& catalog) const
{
    if (state.frame.is_heliocentric()) {
        return state;
    }
    return SOITransitionManager::body_to_helio(state, catalog.heliocentric_state(state.frame.body, state.time));
}

StepResult ShipPropagator::step(const ShipState& ship, const SimulationContext& ctx, Real dt,
                                const PropulsionCommand& command) const
{
    if (!ctx.catalog) {
        throw std::invalid_argument("ShipPropagator::step: context has no body catalog");
    }
    const bodies::BodyCatalog& catalog = *ctx.catalog;

    StepResult result{ship};
    if (!std::isfinite(dt) || dt <= 0.0) {
        result.status = StepStatus::InvalidStep;
        return result;
    }

    ShipState& next = result.ship;
    Real t0 = ctx.time;
    Real t1 = t0 + dt;

    auto fail = [&](const char* stage) {
        Logger::warn("{}: non-finite state during {} at t={}, keeping last good state",
                     ship.name, stage, t1);
        StepResult failed{ship};
        failed.status = StepStatus::NonFiniteState;
        failed.thrust_attempted = result.thrust_attempted;
        failed.state = state_at(ship, t0).state;
        return failed;
    };

    // ------------------------------------------------------------------------
    // Kepler propagation and SOI handling
    // ------------------------------------------------------------------------
    PropagationResult end = state_at(next, t1);
    if (!end.valid) {
        return fail("propagation");
    }
    result.low_confidence = !end.converged || end.asymptotic;

    if (next.frame.is_heliocentric()) {
        PropagationResult start = state_at(next, t0);
        if (!start.valid) {
            return fail("propagation");
        }

        auto entry = soi_.detect_entry(start.state.position, end.state.position, t0, t1,
                                       catalog, ctx.soi_candidates, next.soi);
        if (entry) {
            const bodies::Body& body = catalog.get(entry->body);
            StateVector at_entry = state_at(next, entry->time).state;
            StateVector body_state = catalog.heliocentric_state(body.id, entry->time);

            auto transition = soi_.enter(next, body, at_entry, body_state);
            if (transition) {
                result.transitions.push_back(*transition);
                end = state_at(next, t1);
                if (!end.valid) {
                    return fail("SOI entry");
                }
                if (!next.extreme_flyby) {
                    result.collision = soi_.enforce_safe_periapsis(next, body, end.state);
                    if (result.collision) {
                        end = state_at(next, t1);
                    }
                }
            }
        }
    } else {
        const bodies::Body& body = catalog.get(next.frame.body);
        if (soi_.should_exit(end.state.position, body)) {
            StateVector body_state = catalog.heliocentric_state(body.id, t1);
            Real primary_mu = catalog.get(catalog.primary()).mu;
            auto transition = soi_.exit(next, end.state, body_state, primary_mu);
            if (transition) {
                result.transitions.push_back(*transition);
                end = state_at(next, t1);
            }
        } else if (!next.extreme_flyby) {
            result.collision = soi_.enforce_safe_periapsis(next, body, end.state);
            if (result.collision) {
                end = state_at(next, t1);
            }
        }
    }

    if (!end.valid) {
        return fail("SOI transition");
    }

    // ------------------------------------------------------------------------
    // Thrust
    // ------------------------------------------------------------------------
    StateVector helio = to_heliocentric(end.state, catalog);
    bool can_thrust = result.transitions.empty() && !next.extreme_flyby &&
                      command.deployment_percent > 0.0 &&
                      helio.position.length() >= settings_.sun_approach_radius;

    if (can_thrust) {
        Vec3 accel = sail::thrust_acceleration(next.sail, command, helio.position,
                                               helio.velocity, next.mass_kg);
        result.thrust_attempted = true;
        ThrustResult thrust = thrust_.apply(next.elements, accel, dt, t1);
        result.thrust = thrust.status;
        if (thrust.status == ThrustStatus::NonFiniteState) {
            return fail("thrust");
        }
        next.elements = thrust.elements;
        if (thrust.status == ThrustStatus::Applied) {
            end = state_at(next, t1);
            if (!end.valid) {
                return fail("thrust");
            }
            helio = to_heliocentric(end.state, catalog);
        }
    }

    if (!helio.is_finite()) {
        return fail("frame conversion");
    }

    result.state = end.state;
    result.helio_position = helio.position;
    result.helio_velocity = helio.velocity;
    return result;
}

} // namespace conics::orbital
