#pragma once
/**
 * @file gravity_assist.h
 * @brief Hyperbolic flyby analysis
 *
 * Excess velocity, turning angle and asymptotic velocity rotation for a
 * ship passing through a body's sphere of influence.
 */

#include "conics/orbital/elements.h"

namespace conics::orbital {

enum class FlybyStatus : UInt8 {
    Ok,
    NotHyperbolic,      ///< Captured or parabolic; v-infinity is zero
    NonFiniteState
};

const char* flyby_status_name(FlybyStatus status);

/**
 * @brief Flyby geometry derived from an in-SOI hyperbolic state
 *
 * Vectors are in the body-centred frame of the flyby.
 */
struct GravityAssistResult {
    FlybyStatus status{FlybyStatus::NotHyperbolic};
    Real v_infinity{0.0};           ///< Entry excess speed, AU/day
    Real v_infinity_exit{0.0};      ///< Exit excess speed from the exit state energy
    Real turning_angle{0.0};        ///< Radians
    Real measured_turning_angle{0.0};   ///< Angle between entry and exit velocities
    Real asymptotic_angle{0.0};     ///< acos(-1/e)
    Real periapsis{0.0};            ///< AU
    Real eccentricity{0.0};
    Real b_parameter{0.0};          ///< Impact parameter, AU
    Real delta_v{0.0};              ///< |v_out - v_in|, AU/day
    Vec3 v_in;                      ///< Incoming asymptotic velocity
    Vec3 v_out;                     ///< Outgoing asymptotic velocity

    bool ok() const { return status == FlybyStatus::Ok; }
};

/**
 * @brief Planning estimate for a flyby from heliocentric velocities
 */
struct FlybyPrediction {
    bool valid{false};
    Real v_infinity{0.0};
    Real turning_angle{0.0};
    Real eccentricity{0.0};
    Real b_parameter{0.0};
    Vec3 exit_velocity;             ///< Heliocentric
    Real delta_v{0.0};
};

// ============================================================================
// Closed-form relations
// ============================================================================

/// sqrt(-mu/a), zero for e < 1 or near-parabolic orbits
Real excess_velocity(Real a, Real e, Real mu);

/// 2 asin(1 / (1 + r_p v_inf^2 / mu)) with the argument clamped
Real turning_angle(Real periapsis, Real v_infinity, Real mu);

/// sqrt(r_p^2 + 2 r_p mu / v_inf^2)
Real b_parameter(Real periapsis, Real v_infinity, Real mu);

// ============================================================================
// Analyzer
// ============================================================================

class GravityAssistAnalyzer {
public:
    /**
     * @brief Analyze a flyby from its entry and exit states
     *
     * @throws FrameMismatchError if the states are not in the same body frame
     */
    GravityAssistResult analyze(const StateVector& entry, const StateVector& exit, Real mu) const;

    /**
     * @brief Geometry of the hyperbola described by elements alone
     */
    GravityAssistResult analyze(const OrbitalElements& elements) const;

    /**
     * @brief Estimate the heliocentric exit velocity of a planned flyby
     *
     * @param v_approach Heliocentric ship velocity before the flyby
     * @param periapsis Closest approach distance, AU
     * @param v_planet Heliocentric planet velocity
     * @param mu Planet gravitational parameter
     * @param normal Flyby plane normal; the excess velocity turns about it
     */
    FlybyPrediction predict(const Vec3& v_approach, Real periapsis, const Vec3& v_planet,
                            Real mu, const Vec3& normal = Vec3::UnitZ()) const;
};

} // namespace conics::orbital
