/**
 * @file thrust.cpp
 * @brief Thrust integration and sail model
 */

#include "conics/orbital/thrust.h"
#include "conics/orbital/conversion.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include <algorithm>
#include <cmath>

namespace conics::orbital {

using namespace constants;

namespace {

/// Orbit normal with the ecliptic fallback for degenerate states
Vec3 orbit_normal(const Vec3& position, const Vec3& velocity)
{
    Vec3 h = position.cross(velocity);
    Real h_mag = h.length();
    if (h_mag > ANGULAR_MOMENTUM_EPSILON) {
        return h / h_mag;
    }
    return Vec3::UnitZ();
}

} // anonymous namespace

// ============================================================================
// Sail Model
// ============================================================================

namespace sail {

Real solar_pressure(Real distance_au)
{
    Real r = std::max(distance_au, MIN_PRESSURE_DISTANCE);
    return SOLAR_PRESSURE_1AU / (r * r);
}

Vec3 sun_direction(const Vec3& position)
{
    Real r = position.length();
    if (r < 1e-10) {
        return Vec3::UnitX();
    }
    return position / r;
}

Vec3 thrust_direction(const Vec3& position, const Vec3& velocity, Real yaw, Real pitch)
{
    Vec3 R = sun_direction(position);
    Vec3 N = orbit_normal(position, velocity);
    Vec3 T = N.cross(R);

    Vec3 planar = R * std::cos(yaw) + T * std::sin(yaw);
    return planar * std::cos(pitch) + N * std::sin(pitch);
}

Vec3 thrust_acceleration(const SailGeometry& geometry, const PropulsionCommand& command,
                         const Vec3& position, const Vec3& velocity, Real mass_kg)
{
    if (mass_kg <= 0.0) {
        return Vec3::Zero();
    }

    Real effective_area = geometry.area_m2 * (command.deployment_percent / 100.0) *
                          (geometry.condition_percent / 100.0);
    Real pressure = solar_pressure(position.length());

    Real cos_yaw = std::cos(command.yaw);
    Real cos_pitch = std::cos(command.pitch);
    Real force = 2.0 * pressure * effective_area * cos_yaw * cos_yaw *
                 cos_pitch * cos_pitch * geometry.reflectivity *
                 static_cast<Real>(geometry.sail_count);

    Real accel = force / mass_kg * ACCEL_CONVERSION;
    return thrust_direction(position, velocity, command.yaw, command.pitch) * accel;
}

Real characteristic_acceleration(Real area_m2, Real reflectivity, Real mass_kg)
{
    Real force = 2.0 * SOLAR_PRESSURE_1AU * area_m2 * reflectivity;
    return force / mass_kg * ACCEL_CONVERSION;
}

Real optimal_sail_angle()
{
    return std::atan(1.0 / std::sqrt(2.0));
}

Real estimate_delta_a_per_orbit(Real a, Real characteristic_accel, Real sail_angle)
{
    Real period = TWO_PI * std::sqrt(a * a * a / MU_SUN);
    Real avg_accel = characteristic_accel / (a * a);
    Real tangential = avg_accel * std::cos(sail_angle) * std::sin(sail_angle);
    Real h = std::sqrt(MU_SUN * a);
    return (2.0 * a * a / h) * tangential * period;
}

} // namespace sail

// ============================================================================
// RTN and Gauss Rates
// ============================================================================

RTN ecliptic_to_rtn(const Vec3& vector, const Vec3& position, const Vec3& velocity)
{
    Vec3 R = position.normalized();
    Vec3 N = orbit_normal(position, velocity);
    Vec3 T = N.cross(R);
    return {vector.dot(R), vector.dot(T), vector.dot(N)};
}

ElementRates gauss_rates(const OrbitalElements& el, Real nu, const RTN& f)
{
    ElementRates rates;
    Real a = el.semi_major_axis();
    Real e = el.eccentricity();
    Real p = el.semi_latus_rectum();
    Real h = std::sqrt(el.mu() * p);
    Real r = p / (1.0 + e * std::cos(nu));
    Real u = el.arg_periapsis() + nu;
    Real sin_nu = std::sin(nu);
    Real cos_nu = std::cos(nu);
    Real sin_i = std::sin(el.inclination());

    rates.semi_major_axis = 2.0 * a * a / h * (e * sin_nu * f.radial + p / r * f.transverse);
    rates.eccentricity = (p * sin_nu * f.radial + ((p + r) * cos_nu + r * e) * f.transverse) / h;
    rates.inclination = r * std::cos(u) / h * f.normal;

    Real node_term = 0.0;
    if (std::abs(sin_i) > NODE_EPSILON) {
        rates.raan = r * std::sin(u) / (h * sin_i) * f.normal;
        node_term = rates.raan * std::cos(el.inclination());
    }
    if (e > CIRCULAR_ECCENTRICITY) {
        rates.arg_periapsis = (-p * cos_nu * f.radial + (p + r) * sin_nu * f.transverse) / (h * e)
                            - node_term;
    }
    return rates;
}

// ============================================================================
// ThrustIntegrator
// ============================================================================

ThrustResult ThrustIntegrator::apply(const OrbitalElements& elements, const Vec3& acceleration,
                                     Real dt, Real time) const
{
    if (!acceleration.is_finite() || !std::isfinite(dt)) {
        return {elements, ThrustStatus::NonFiniteState};
    }
    if (acceleration.length() < min_thrust_) {
        return {elements, ThrustStatus::BelowThreshold};
    }

    PropagationResult current = propagate(elements, time);
    if (!current.valid || current.state.position.length_squared() == 0.0) {
        Logger::warn("Thrust skipped: elements do not produce a finite state at t={}", time);
        return {elements, ThrustStatus::NonFiniteState};
    }

    Vec3 new_velocity = current.state.velocity + acceleration * dt;
    auto updated = state_to_elements(current.state.position, new_velocity, elements.mu(), time);
    if (!updated) {
        Logger::warn("Thrust rejected: reconversion produced non-finite elements at t={}", time);
        return {elements, ThrustStatus::NonFiniteState};
    }
    return {*updated, ThrustStatus::Applied};
}

} // namespace conics::orbital
