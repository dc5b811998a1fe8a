/**
 * @file conversion.cpp
 * @brief State vector <-> orbital element conversion
 */

#include "conics/orbital/conversion.h"
#include "conics/orbital/anomaly.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include <algorithm>
#include <cmath>

namespace conics::orbital {

using namespace constants;

namespace {

/// |h| / (|r||v|) below this is radial motion
constexpr Real RADIAL_MOTION_RATIO = 1e-10;

Real semi_latus_rectum(Real a, Real e)
{
    Real p = (e >= 1.0) ? std::abs(a) * (e * e - 1.0) : a * (1.0 - e * e);
    return std::max(p, MIN_SEMI_LATUS_RECTUM);
}

} // anonymous namespace

// ============================================================================
// Geometry
// ============================================================================

Mat3x3 perifocal_to_parent(Real inclination, Real raan, Real arg_periapsis)
{
    return Mat3x3::RotationZ(raan) * Mat3x3::RotationX(inclination) *
           Mat3x3::RotationZ(arg_periapsis);
}

Real orbital_radius(Real a, Real e, Real true_anomaly)
{
    if (e < CIRCULAR_ECCENTRICITY) {
        return a;
    }
    return a * (1.0 - e * e) / (1.0 + e * std::cos(true_anomaly));
}

void state_at_true_anomaly(const OrbitalElements& el, Real nu, Vec3& position, Vec3& velocity)
{
    Real e = el.eccentricity();
    Real r = orbital_radius(el.semi_major_axis(), e, nu);
    Real p = semi_latus_rectum(el.semi_major_axis(), e);
    Real speed = std::sqrt(el.mu() / p);

    Real c = std::cos(nu);
    Real s = std::sin(nu);
    Vec3 pos_pf{r * c, r * s, 0.0};
    Vec3 vel_pf{-speed * s, speed * (e + c), 0.0};

    Mat3x3 rot = perifocal_to_parent(el.inclination(), el.raan(), el.arg_periapsis());
    position = rot * pos_pf;
    velocity = rot * vel_pf;
}

// ============================================================================
// Elements -> State
// ============================================================================

PropagationResult propagate(const OrbitalElements& el, Real time, Frame frame)
{
    PropagationResult result;
    result.state.frame = frame;
    result.state.time = time;

    Real e = el.eccentricity();
    Real n = el.mean_motion();
    Real dt = time - el.epoch();

    if (el.is_hyperbolic()) {
        Real m = anomaly::propagate_mean_anomaly(el.mean_anomaly_at_epoch(), n, dt, true);
        anomaly::SolverResult solve = anomaly::solve_hyperbolic(m, e);
        anomaly::Conversion nu = anomaly::hyperbolic_to_true(solve.anomaly, e);
        result.true_anomaly = nu.anomaly;
        result.converged = solve.converged;
        result.asymptotic = nu.clamped;
    } else {
        Real m = anomaly::propagate_mean_anomaly(el.mean_anomaly_at_epoch(), n, dt, false);
        anomaly::SolverResult solve = anomaly::solve_elliptic(m, e);
        result.true_anomaly = anomaly::eccentric_to_true(solve.anomaly, e);
        result.converged = solve.converged;
    }

    state_at_true_anomaly(el, result.true_anomaly, result.state.position, result.state.velocity);

    result.valid = result.state.is_finite();
    if (!result.valid) {
        Logger::warn("Propagation produced a non-finite state (a={}, e={}, t={})",
                     el.semi_major_axis(), e, time);
    }
    return result;
}

StateVector elements_to_state(const OrbitalElements& elements, Real time, Frame frame)
{
    return propagate(elements, time, frame).state;
}

// ============================================================================
// State -> Elements
// ============================================================================

namespace {

/// Signed angle from `from` to `to`, positive about the unit vector `axis`
Real angle_about(const Vec3& from, const Vec3& to, const Vec3& axis)
{
    return std::atan2(axis.dot(from.cross(to)), from.dot(to));
}

/// Non-negative true anomaly at which the conic reaches radius r
Real anomaly_at_radius(Real a, Real e, Real r)
{
    Real p = semi_latus_rectum(a, e);
    return std::acos(math::clamp_unit((p / r - 1.0) / e));
}

/// Plane normal for motion along the radius vector: the reference normal
/// with its radial component removed
Vec3 radial_plane_normal(const Vec3& r_hat)
{
    Vec3 reference = (std::abs(r_hat.z) < 0.9) ? Vec3::UnitZ() : Vec3::UnitX();
    return (reference - r_hat * reference.dot(r_hat)).normalized();
}

} // anonymous namespace

std::optional<OrbitalElements> state_to_elements(const Vec3& pos, const Vec3& vel,
                                                 Real mu, Real epoch)
{
    if (!pos.is_finite() || !vel.is_finite() || !std::isfinite(mu) || mu <= 0.0 ||
        !std::isfinite(epoch)) {
        return std::nullopt;
    }

    Real r = pos.length();
    if (r <= 0.0) {
        return std::nullopt;
    }
    Real v2 = vel.length_squared();

    Vec3 h = pos.cross(vel);
    Real h_mag = h.length();
    bool radial = h_mag <= RADIAL_MOTION_RATIO * r * std::sqrt(v2);

    Real energy = v2 / 2.0 - mu / r;
    Real a = (std::abs(energy) < PARABOLIC_ENERGY_EPSILON)
           ? r * PARABOLIC_SMA_FACTOR
           : -mu / (2.0 * energy);

    Real r_dot_v = pos.dot(vel);
    Vec3 e_vec = pos * (v2 / mu - 1.0 / r) - vel * (r_dot_v / mu);
    Real e = e_vec.length();

    // Radial motion has e = 1 for any energy
    bool nudged = radial;
    if (radial || (e >= NEAR_PARABOLIC_LOW && e <= NEAR_PARABOLIC_HIGH)) {
        e = (energy < 0.0) ? NEAR_PARABOLIC_LOW : NEAR_PARABOLIC_HIGH;
        nudged = true;
    }
    bool hyperbolic = e >= 1.0;

    // a keeps the energy; only its magnitude is floored
    Real final_a;
    if (hyperbolic) {
        Real min_magnitude = (std::abs(a) < 0.001) ? MIN_SEMI_MAJOR_AXIS : MIN_HYPERBOLIC_SMA;
        final_a = -std::max(std::abs(a), min_magnitude);
    } else {
        final_a = std::max(MIN_SEMI_MAJOR_AXIS, a);
        if (!std::isfinite(final_a) || a <= 0.0) {
            final_a = r;
        }
    }

    // The adjusted conic must still reach r; at the limit r becomes an apsis
    if (nudged) {
        if (hyperbolic) {
            final_a = -std::min(-final_a, r / (e - 1.0));
        } else {
            final_a = std::clamp(final_a, r / (1.0 + e), r / (1.0 - e));
        }
    }

    // Orbit plane
    Vec3 normal = radial ? radial_plane_normal(pos / r) : h / h_mag;
    Real node_mag = std::sqrt(normal.x * normal.x + normal.y * normal.y);

    Real inc = 0.0;
    Real raan = 0.0;
    Vec3 node_dir = Vec3::UnitX();
    if (node_mag < NODE_EPSILON) {
        // Equatorial: angles measured from the x axis about +z or -z
        normal = (normal.z >= 0.0) ? Vec3::UnitZ() : -Vec3::UnitZ();
        inc = (normal.z > 0.0) ? 0.0 : PI;
    } else {
        inc = std::atan2(node_mag, normal.z);
        raan = math::wrap_two_pi(std::atan2(normal.x, -normal.y));
        node_dir = Vec3{-normal.y, normal.x, 0.0} / node_mag;
    }

    Real nu = 0.0;
    Real argp = 0.0;
    if (nudged) {
        // Place the ship at its actual radius on the adjusted conic
        nu = anomaly_at_radius(final_a, e, r);
        if (r_dot_v < 0.0) {
            nu = -nu;
        }
        argp = angle_about(node_dir, pos, normal) - nu;
    } else if (e > CIRCULAR_ECCENTRICITY) {
        argp = angle_about(node_dir, e_vec, normal);
        nu = angle_about(e_vec, pos, normal);
    } else {
        nu = angle_about(node_dir, pos, normal);
    }
    argp = math::wrap_two_pi(argp);
    if (!hyperbolic) {
        nu = math::wrap_two_pi(nu);
    }

    Real m0 = 0.0;
    if (hyperbolic) {
        anomaly::Conversion H = anomaly::true_to_hyperbolic(nu, e);
        m0 = anomaly::hyperbolic_to_mean(H.anomaly, e);
    } else {
        Real E = (e < CIRCULAR_ECCENTRICITY) ? nu : anomaly::true_to_eccentric(nu, e);
        m0 = math::wrap_two_pi(anomaly::eccentric_to_mean(E, e));
    }

    OrbitalElements result = detail::ElementsAccess::make(final_a, e, inc, raan, argp, m0,
                                                          epoch, mu);
    if (!result.is_finite()) {
        return std::nullopt;
    }
    return result;
}

std::optional<OrbitalElements> state_to_elements(const StateVector& state, Real mu)
{
    return state_to_elements(state.position, state.velocity, mu, state.time);
}

} // namespace conics::orbital
