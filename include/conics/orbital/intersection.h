#pragma once
/**
 * @file intersection.h
 * @brief Orbit crossing and closest-approach detection
 *
 * Works on a predicted trajectory only; never advances any state.
 */

#include "conics/bodies/body.h"
#include "conics/core/cache.h"
#include "conics/orbital/prediction.h"
#include <string>
#include <vector>

namespace conics::orbital {

enum class EncounterKind : UInt8 {
    Approaching,        ///< Radius crossing while the separation is shrinking
    Receding,           ///< Radius crossing while the separation is growing
    ClosestApproach     ///< Minimum separation over the trajectory
};

const char* encounter_kind_name(EncounterKind kind);

struct IntersectionEvent {
    BodyId body{INVALID_BODY_ID};
    std::string body_name;
    Real time{0.0};
    Vec3 ship_position;         ///< Heliocentric
    Vec3 body_position;         ///< Heliocentric
    Real distance{0.0};         ///< |ship - body|
    Real in_plane_distance{0.0};    ///< Separation within the target's orbital plane
    Real out_of_plane_distance{0.0};///< Separation along the target's orbit normal
    Real target_radius{0.0};    ///< Orbital radius tested; 0 for closest approach
    EncounterKind kind{EncounterKind::Approaching};
};

struct IntersectionReport {
    std::vector<IntersectionEvent> events;
    bool partial{false};        ///< Time budget exhausted before all bodies were examined
    bool truncated{false};      ///< More than max_results events found; the latest were dropped
    SizeT total_found{0};       ///< Events found before the max_results cap
    UInt64 trajectory_hash{0};
};

using IntersectionCache = ContentCache<IntersectionReport>;

struct IntersectionSettings {
    int max_results{20};
    Real time_budget_ms{10.0};
    Real eccentricity_threshold{0.05};
    Real radius_separation{0.01};
    Real time_rounding{1e-3};
    bool closest_approach{true};
};

/**
 * @brief Closest point between two linearly moving points over one segment
 */
struct SegmentApproach {
    Real s{0.0};                ///< Segment parameter, 0..1
    Real distance{0.0};
    Vec3 ship_position;
    Vec3 body_position;
};

SegmentApproach closest_approach(const Vec3& ship_p1, const Vec3& ship_p2,
                                 const Vec3& body_p1, const Vec3& body_p2);

/**
 * @brief Inclusive radius crossing on a segment
 * @return Interpolation parameter in [0, 1], or a negative value when the
 *         segment does not touch the radius
 */
Real radius_crossing(Real r1, Real r2, Real target_radius);

class IntersectionDetector {
public:
    explicit IntersectionDetector(IntersectionSettings settings = {});

    const IntersectionSettings& settings() const { return settings_; }

    /**
     * @brief Find crossings of target orbital radii and closest approaches
     *
     * @param bodies Candidate targets; only bodies orbiting the primary are used
     * @param reference_time Segments ending before this time are skipped
     * @return Events sorted by time, ties by body name, at most max_results
     */
    IntersectionReport detect(const Trajectory& trajectory, const bodies::BodyCatalog& catalog,
                              const std::vector<BodyId>& bodies, Real reference_time) const;

    /**
     * @brief Detect through a cache keyed by the trajectory hash
     */
    std::shared_ptr<const IntersectionReport> detect(const Trajectory& trajectory,
                                                     const bodies::BodyCatalog& catalog,
                                                     const std::vector<BodyId>& bodies,
                                                     Real reference_time,
                                                     IntersectionCache& cache) const;

    /// Radii tested for a target: a, plus perihelion and aphelion for eccentric orbits
    std::vector<Real> target_radii(const OrbitalElements& elements) const;

private:
    IntersectionSettings settings_;
};

} // namespace conics::orbital
