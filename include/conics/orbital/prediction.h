#pragma once
/**
 * @file prediction.h
 * @brief Forward trajectory prediction
 *
 * Steps a copy of a ship with the same physics as the live step and
 * records time-stamped samples. Prediction stops early, with a recorded
 * reason, when the state becomes unusable or the time budget runs out.
 */

#include "conics/core/cache.h"
#include "conics/orbital/propagator.h"
#include <vector>

namespace conics::orbital {

enum class TruncationReason : UInt8 {
    None,
    NonFinite,              ///< NaN or infinite coordinate
    MaxDistance,            ///< Beyond the maximum heliocentric radius
    SunApproach,            ///< Inside the sun-approach radius
    OrbitalInstability,     ///< Thrust produced non-finite elements
    EccentricInstability,   ///< Thrust produced e < 0 or e above the extreme threshold
    TimeBudget              ///< Wall-clock budget exhausted
};

const char* truncation_reason_name(TruncationReason reason);

struct TrajectorySample {
    Real time{0.0};
    StateVector state;          ///< Ship frame
    Vec3 helio_position;
    Vec3 helio_velocity;
};

struct Trajectory {
    std::vector<TrajectorySample> samples;
    bool truncated{false};
    TruncationReason reason{TruncationReason::None};
    bool low_confidence{false};
    std::vector<Transition> transitions;
    Real start_time{0.0};
    Real duration{0.0};
    int steps{0};
    UInt64 hash{0};

    bool empty() const { return samples.empty(); }
};

using TrajectoryCache = ContentCache<Trajectory>;

struct PredictionSettings {
    Real duration_default{60.0};
    Real duration_min{30.0};
    Real duration_max{730.0};
    int steps_default{200};
    bool scale_steps_with_duration{false};  ///< Derive steps from steps_per_day
    Real steps_per_day{5.0};
    int steps_min{100};
    int steps_max{2000};
    Real max_distance{10.0};                ///< AU
    Real time_budget_ms{50.0};
};

class TrajectoryPredictor {
public:
    TrajectoryPredictor(ShipPropagator propagator, PredictionSettings settings = {});

    const PredictionSettings& settings() const { return settings_; }

    /**
     * @brief Predict a trajectory
     * @param ctx Start time, body catalog and SOI candidates
     * @param duration_days <= 0 selects the default; clamped to [min, max]
     * @param steps <= 0 selects the default (or the duration-scaled count)
     * @throws std::invalid_argument if ctx.catalog is null
     */
    Trajectory predict(const ShipState& ship, const SimulationContext& ctx,
                       const PropulsionCommand& command,
                       Real duration_days = 0.0, int steps = 0) const;

    /**
     * @brief Predict through a caller-owned cache
     *
     * Returns the cached trajectory when the rounded inputs hash matches
     * and the entry has not expired.
     */
    std::shared_ptr<const Trajectory> predict(const ShipState& ship, const SimulationContext& ctx,
                                              const PropulsionCommand& command,
                                              TrajectoryCache& cache,
                                              Real duration_days = 0.0, int steps = 0) const;

    Real resolve_duration(Real duration_days) const;
    int resolve_steps(Real duration_days, int steps) const;

    /**
     * @brief Hash of the rounded prediction inputs
     */
    UInt64 input_hash(const ShipState& ship, const SimulationContext& ctx,
                      const PropulsionCommand& command, Real duration_days, int steps) const;

private:
    ShipPropagator propagator_;
    PredictionSettings settings_;
};

} // namespace conics::orbital
