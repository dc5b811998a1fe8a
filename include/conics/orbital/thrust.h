#pragma once
/**
 * @file thrust.h
 * @brief Low-thrust integration and the solar sail thrust model
 *
 * Thrust is applied with the state-vector method: the velocity is
 * perturbed at a fixed position and the state is reconverted to elements.
 */

#include "conics/orbital/elements.h"

namespace conics::orbital {

// ============================================================================
// Sail Hardware and Command
// ============================================================================

/**
 * @brief Physical sail properties carried by a ship
 */
struct SailGeometry {
    Real area_m2{3.0e6};
    Real reflectivity{0.9};
    Real condition_percent{100.0};  ///< Degradation, 0..100
    int sail_count{1};              ///< Identical sails, thrust multiplier
};

/**
 * @brief Caller-supplied sail command
 */
struct PropulsionCommand {
    Real deployment_percent{100.0};
    Real yaw{0.6};                  ///< In-plane angle from the sun line toward prograde (rad)
    Real pitch{0.0};                ///< Out-of-plane angle toward the orbit normal (rad)
};

/**
 * @brief Radial / transverse / normal components
 */
struct RTN {
    Real radial{0.0};
    Real transverse{0.0};
    Real normal{0.0};
};

/**
 * @brief Element time derivatives from Gauss's variational equations
 *
 * Diagnostic only; integration uses the state-vector method.
 */
struct ElementRates {
    Real semi_major_axis{0.0};  ///< AU/day
    Real eccentricity{0.0};     ///< 1/day
    Real inclination{0.0};      ///< rad/day
    Real raan{0.0};             ///< rad/day
    Real arg_periapsis{0.0};    ///< rad/day
};

// ============================================================================
// Sail Model
// ============================================================================

namespace sail {

/// Radiation pressure (N/m^2), distance floored at 0.01 AU
Real solar_pressure(Real distance_au);

/// Unit vector from the Sun to the position; +x at the origin
Vec3 sun_direction(const Vec3& position);

/**
 * @brief Unit thrust direction
 *
 * cos(pitch) (cos(yaw) R + sin(yaw) T) + sin(pitch) N with R the sun
 * direction, N the orbit normal (z when |h| < 1e-10) and T = N x R.
 */
Vec3 thrust_direction(const Vec3& position, const Vec3& velocity, Real yaw, Real pitch);

/**
 * @brief Thrust acceleration (AU/day^2) on a ship
 * @param position Heliocentric position (AU)
 * @param velocity Heliocentric velocity (AU/day)
 * @param mass_kg Ship mass
 */
Vec3 thrust_acceleration(const SailGeometry& geometry, const PropulsionCommand& command,
                         const Vec3& position, const Vec3& velocity, Real mass_kg);

/// Acceleration at 1 AU with the sail face-on (AU/day^2)
Real characteristic_acceleration(Real area_m2, Real reflectivity, Real mass_kg);

/// atan(1/sqrt(2)), maximizes the transverse component
Real optimal_sail_angle();

/// Heliocentric semi-major axis change over one orbit (circular approximation)
Real estimate_delta_a_per_orbit(Real a, Real characteristic_accel, Real sail_angle);

} // namespace sail

/**
 * @brief Project a vector onto the RTN frame of a state
 */
RTN ecliptic_to_rtn(const Vec3& vector, const Vec3& position, const Vec3& velocity);

/**
 * @brief Gauss variational rates for an RTN acceleration
 */
ElementRates gauss_rates(const OrbitalElements& elements, Real true_anomaly, const RTN& accel);

// ============================================================================
// Thrust Integrator
// ============================================================================

enum class ThrustStatus : UInt8 {
    Applied,
    BelowThreshold,     ///< Thrust magnitude under the minimum, elements unchanged
    NonFiniteState      ///< Input or result not finite, elements unchanged
};

struct ThrustResult {
    OrbitalElements elements;
    ThrustStatus status{ThrustStatus::Applied};
};

class ThrustIntegrator {
public:
    explicit ThrustIntegrator(Real min_thrust = 1e-20) : min_thrust_(min_thrust) {}

    /**
     * @brief Apply v' = v + a dt at the given time
     *
     * The returned elements have their epoch at @p time. The acceleration
     * shares axes with the elements' frame.
     */
    ThrustResult apply(const OrbitalElements& elements, const Vec3& acceleration,
                       Real dt, Real time) const;

    Real min_thrust() const { return min_thrust_; }

private:
    Real min_thrust_;
};

} // namespace conics::orbital
