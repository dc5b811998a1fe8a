/**
 * @file prediction.cpp
 * @brief Trajectory prediction
 */

#include "conics/orbital/prediction.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace conics::orbital {

namespace {

constexpr Real ELEMENT_QUANTUM = 1e-9;
constexpr Real ANGLE_QUANTUM = 1e-6;

} // anonymous namespace

const char* truncation_reason_name(TruncationReason reason)
{
    switch (reason) {
        case TruncationReason::None:                 return "none";
        case TruncationReason::NonFinite:            return "non-finite";
        case TruncationReason::MaxDistance:          return "max-distance";
        case TruncationReason::SunApproach:          return "sun-approach";
        case TruncationReason::OrbitalInstability:   return "orbital-instability";
        case TruncationReason::EccentricInstability: return "eccentric-instability";
        case TruncationReason::TimeBudget:           return "time-budget";
    }
    return "unknown";
}

TrajectoryPredictor::TrajectoryPredictor(ShipPropagator propagator, PredictionSettings settings)
    : propagator_(std::move(propagator))
    , settings_(settings)
{
}

Real TrajectoryPredictor::resolve_duration(Real duration_days) const
{
    if (!std::isfinite(duration_days) || duration_days <= 0.0) {
        duration_days = settings_.duration_default;
    }
    return std::clamp(duration_days, settings_.duration_min, settings_.duration_max);
}

int TrajectoryPredictor::resolve_steps(Real duration_days, int steps) const
{
    if (steps > 0) {
        return std::min(steps, settings_.steps_max);
    }
    if (!settings_.scale_steps_with_duration) {
        return settings_.steps_default;
    }
    int derived = static_cast<int>(std::ceil(duration_days * settings_.steps_per_day));
    return std::clamp(derived, settings_.steps_min, settings_.steps_max);
}

UInt64 TrajectoryPredictor::input_hash(const ShipState& ship, const SimulationContext& ctx,
                                       const PropulsionCommand& command,
                                       Real duration_days, int steps) const
{
    Real duration = resolve_duration(duration_days);
    int step_count = resolve_steps(duration, steps);
    const OrbitalElements& el = ship.elements;

    HashBuilder hash;
    hash.add(el.semi_major_axis(), ELEMENT_QUANTUM)
        .add(el.eccentricity(), ELEMENT_QUANTUM)
        .add(el.inclination(), ANGLE_QUANTUM)
        .add(el.raan(), ANGLE_QUANTUM)
        .add(el.arg_periapsis(), ANGLE_QUANTUM)
        .add(el.mean_anomaly_at_epoch(), ANGLE_QUANTUM)
        .add(el.epoch(), constants::TIME_ROUNDING)
        .add(command.yaw, ANGLE_QUANTUM)
        .add(command.pitch, ANGLE_QUANTUM)
        .add(command.deployment_percent, 1e-3)
        .add(ship.sail.area_m2, 1.0)
        .add(ship.sail.reflectivity, 1e-6)
        .add(ship.sail.condition_percent, 1e-3)
        .add(static_cast<UInt64>(ship.sail.sail_count))
        .add(ship.mass_kg, 1e-3)
        .add(ctx.time, constants::TIME_ROUNDING)
        .add(duration, constants::TIME_ROUNDING)
        .add(static_cast<UInt64>(step_count))
        .add(static_cast<UInt64>(ship.frame.kind))
        .add(static_cast<UInt64>(ship.frame.body))
        .add(static_cast<UInt64>(ship.extreme_flyby ? 1 : 0))
        .add(ship.extreme_flyby ? ship.extreme_flyby->entry_time : 0.0, constants::TIME_ROUNDING);
    for (BodyId id : ctx.soi_candidates) {
        hash.add(static_cast<UInt64>(id));
    }
    return hash.value();
}

Trajectory TrajectoryPredictor::predict(const ShipState& ship, const SimulationContext& ctx,
                                        const PropulsionCommand& command,
                                        Real duration_days, int steps) const
{
    using Clock = std::chrono::steady_clock;
    auto started = Clock::now();

    if (!ctx.catalog) {
        throw std::invalid_argument("TrajectoryPredictor::predict: context has no body catalog");
    }

    Trajectory trajectory;
    trajectory.start_time = ctx.time;
    trajectory.duration = resolve_duration(duration_days);
    trajectory.steps = resolve_steps(trajectory.duration, steps);
    trajectory.hash = input_hash(ship, ctx, command, duration_days, steps);
    trajectory.samples.reserve(static_cast<SizeT>(trajectory.steps) + 1);

    const bodies::BodyCatalog& catalog = *ctx.catalog;
    Real dt = trajectory.duration / static_cast<Real>(trajectory.steps);
    Real extreme_e = propagator_.settings().soi.extreme_eccentricity;

    auto truncate = [&](TruncationReason reason) {
        trajectory.truncated = true;
        trajectory.reason = reason;
        Logger::debug("Prediction for {} truncated after {} samples: {}", ship.name,
                      trajectory.samples.size(), truncation_reason_name(reason));
    };

    // Checks a heliocentric point; returns false when the prediction must stop
    auto accept = [&](const Vec3& helio) {
        if (!helio.is_finite()) {
            truncate(TruncationReason::NonFinite);
            return false;
        }
        Real r = helio.length();
        if (r > settings_.max_distance) {
            truncate(TruncationReason::MaxDistance);
            return false;
        }
        if (r < propagator_.settings().sun_approach_radius) {
            truncate(TruncationReason::SunApproach);
            return false;
        }
        return true;
    };

    ShipState current = ship;
    PropagationResult initial = propagator_.state_at(current, ctx.time);
    StateVector initial_helio = propagator_.to_heliocentric(initial.state, catalog);
    if (!initial.valid || !accept(initial_helio.position)) {
        if (!trajectory.truncated) {
            truncate(TruncationReason::NonFinite);
        }
        return trajectory;
    }
    trajectory.low_confidence = !initial.converged || initial.asymptotic;
    trajectory.samples.push_back({ctx.time, initial.state, initial_helio.position, initial_helio.velocity});

    SimulationContext step_ctx = ctx;
    for (int i = 0; i < trajectory.steps; ++i) {
        std::chrono::duration<Real, std::milli> elapsed = Clock::now() - started;
        if (elapsed.count() > settings_.time_budget_ms) {
            truncate(TruncationReason::TimeBudget);
            break;
        }

        step_ctx.time = ctx.time + static_cast<Real>(i) * dt;
        StepResult step = propagator_.step(current, step_ctx, dt, command);

        if (step.status == StepStatus::NonFiniteState) {
            truncate(step.thrust_attempted ? TruncationReason::OrbitalInstability
                                           : TruncationReason::NonFinite);
            break;
        }
        if (step.thrust == ThrustStatus::Applied) {
            Real e = step.ship.elements.eccentricity();
            if (e < 0.0 || e > extreme_e) {
                truncate(TruncationReason::EccentricInstability);
                break;
            }
        }
        if (!accept(step.helio_position)) {
            break;
        }

        trajectory.low_confidence = trajectory.low_confidence || step.low_confidence;
        trajectory.transitions.insert(trajectory.transitions.end(),
                                      step.transitions.begin(), step.transitions.end());
        trajectory.samples.push_back({step.state.time, step.state,
                                      step.helio_position, step.helio_velocity});
        current = std::move(step.ship);
    }
    return trajectory;
}

std::shared_ptr<const Trajectory> TrajectoryPredictor::predict(const ShipState& ship,
                                                               const SimulationContext& ctx,
                                                               const PropulsionCommand& command,
                                                               TrajectoryCache& cache,
                                                               Real duration_days, int steps) const
{
    UInt64 key = input_hash(ship, ctx, command, duration_days, steps);
    if (auto cached = cache.find(key)) {
        return cached;
    }
    return cache.store(key, predict(ship, ctx, command, duration_days, steps));
}

} // namespace conics::orbital
