#pragma once
/**
 * @file conversion.h
 * @brief State vector <-> orbital element conversion
 */

#include "conics/orbital/elements.h"
#include <optional>

namespace conics::orbital {

/**
 * @brief Position and velocity on an orbit at a given time
 */
struct PropagationResult {
    StateVector state;
    Real true_anomaly{0.0};
    bool converged{true};   ///< Kepler solve reached tolerance
    bool asymptotic{false}; ///< Hyperbolic anomaly was clamped near an asymptote
    bool valid{true};       ///< Position and velocity are finite
};

/**
 * @brief Convert a Cartesian state to classical elements
 *
 * The resulting M0 refers to the given epoch. Eccentricities in
 * [0.9999, 1.0001], and all radial motion, are nudged out of the parabolic
 * band. A nudged conic is placed at the current radius, so position is
 * reproduced. It keeps the energy-derived a, and with it the speed, unless
 * that conic cannot reach the radius; a is then limited so the radius
 * becomes an apsis. The velocity direction is approximate. Radial
 * motion takes its plane from the +z reference (+x near the poles).
 * Equatorial orbits measure angles from +x about +z, or about -z when
 * retrograde.
 *
 * @param position Relative to the central body (AU)
 * @param velocity Relative to the central body (AU/day)
 * @param mu Central body gravitational parameter (AU^3/day^2)
 * @param epoch Julian date of the state
 * @return nullopt if the inputs or results are not finite
 */
std::optional<OrbitalElements> state_to_elements(const Vec3& position, const Vec3& velocity,
                                                 Real mu, Real epoch);

/**
 * @brief Convert a tagged state; elements refer to state.time
 */
std::optional<OrbitalElements> state_to_elements(const StateVector& state, Real mu);

/**
 * @brief Propagate elements to a time and return the state
 *
 * The frame tag of the result is copied from @p frame.
 */
PropagationResult propagate(const OrbitalElements& elements, Real time,
                            Frame frame = Frame::heliocentric());

/**
 * @brief Convenience wrapper returning only the state
 */
StateVector elements_to_state(const OrbitalElements& elements, Real time,
                              Frame frame = Frame::heliocentric());

/**
 * @brief Position and velocity in the parent frame for a given true anomaly
 */
void state_at_true_anomaly(const OrbitalElements& elements, Real true_anomaly,
                           Vec3& position, Vec3& velocity);

/**
 * @brief Rotation from the perifocal frame to the parent frame, Rz(raan) Rx(i) Rz(w)
 */
Mat3x3 perifocal_to_parent(Real inclination, Real raan, Real arg_periapsis);

/**
 * @brief Conic radius r = p / (1 + e cos nu); r = a for circular orbits
 */
Real orbital_radius(Real a, Real e, Real true_anomaly);

} // namespace conics::orbital
