/**
 * @file gravity_assist.cpp
 * @brief Hyperbolic flyby analysis
 */

#include "conics/orbital/gravity_assist.h"
#include "conics/core/constants.h"
#include "conics/core/error.h"
#include "conics/core/logger.h"
#include "conics/orbital/conversion.h"
#include <algorithm>
#include <cmath>

namespace conics::orbital {

const char* flyby_status_name(FlybyStatus status)
{
    switch (status) {
        case FlybyStatus::Ok:             return "ok";
        case FlybyStatus::NotHyperbolic:  return "not-hyperbolic";
        case FlybyStatus::NonFiniteState: return "non-finite";
    }
    return "unknown";
}

Real excess_velocity(Real a, Real e, Real mu)
{
    if (e < 1.0 || std::abs(e - 1.0) < constants::CIRCULAR_ECCENTRICITY || a >= 0.0 || mu <= 0.0) {
        return 0.0;
    }
    return std::sqrt(-mu / a);
}

Real turning_angle(Real periapsis, Real v_infinity, Real mu)
{
    if (v_infinity <= 0.0 || mu <= 0.0) {
        return 0.0;
    }
    Real arg = 1.0 / (1.0 + periapsis * v_infinity * v_infinity / mu);
    return 2.0 * std::asin(math::clamp_unit(arg));
}

Real b_parameter(Real periapsis, Real v_infinity, Real mu)
{
    if (v_infinity <= 0.0) {
        return 0.0;
    }
    return std::sqrt(periapsis * periapsis + 2.0 * periapsis * mu / (v_infinity * v_infinity));
}

// ============================================================================
// GravityAssistAnalyzer
// ============================================================================

GravityAssistResult GravityAssistAnalyzer::analyze(const OrbitalElements& elements) const
{
    GravityAssistResult result;
    if (!elements.is_finite()) {
        result.status = FlybyStatus::NonFiniteState;
        return result;
    }

    Real e = elements.eccentricity();
    Real mu = elements.mu();
    result.eccentricity = e;
    result.periapsis = elements.periapsis();
    result.v_infinity = excess_velocity(elements.semi_major_axis(), e, mu);
    if (result.v_infinity <= 0.0) {
        result.status = FlybyStatus::NotHyperbolic;
        return result;
    }

    result.v_infinity_exit = result.v_infinity;
    result.turning_angle = turning_angle(result.periapsis, result.v_infinity, mu);
    result.asymptotic_angle = std::acos(math::clamp_unit(-1.0 / e));
    result.b_parameter = b_parameter(result.periapsis, result.v_infinity, mu);

    // Perifocal axes: P toward periapsis, Q = h x P
    Mat3x3 rot = perifocal_to_parent(elements.inclination(), elements.raan(), elements.arg_periapsis());
    Vec3 p_hat = rot * Vec3::UnitX();
    Vec3 q_hat = rot * Vec3::UnitY();
    Vec3 h_hat = rot * Vec3::UnitZ();

    Real sin_nu = std::sqrt(std::max(0.0, 1.0 - 1.0 / (e * e)));
    Real q_component = e - 1.0 / e;
    Real norm = std::sqrt(e * e - 1.0);
    Vec3 dir_in = (p_hat * sin_nu + q_hat * q_component) / norm;

    result.v_in = dir_in * result.v_infinity;
    result.v_out = math::rotate_about_axis(result.v_in, h_hat, result.turning_angle);
    result.measured_turning_angle = result.turning_angle;
    result.delta_v = (result.v_out - result.v_in).length();
    result.status = FlybyStatus::Ok;
    return result;
}

GravityAssistResult GravityAssistAnalyzer::analyze(const StateVector& entry, const StateVector& exit,
                                                   Real mu) const
{
    require_same_frame(entry.frame, exit.frame, "gravity assist entry/exit");
    if (entry.frame.is_heliocentric()) {
        throw FrameMismatchError("gravity assist requires body-centred states, got " +
                                 to_string(entry.frame));
    }

    GravityAssistResult result;
    if (!entry.is_finite() || !exit.is_finite()) {
        result.status = FlybyStatus::NonFiniteState;
        return result;
    }

    auto elements = state_to_elements(entry, mu);
    if (!elements) {
        result.status = FlybyStatus::NonFiniteState;
        return result;
    }

    result = analyze(*elements);
    if (!result.ok()) {
        return result;
    }

    Real exit_energy = 0.5 * exit.velocity.length_squared() - mu / exit.position.length();
    result.v_infinity_exit = exit_energy > 0.0 ? std::sqrt(2.0 * exit_energy) : 0.0;
    result.measured_turning_angle = math::angle_between(entry.velocity, exit.velocity);

    Real drift = std::abs(result.v_infinity_exit - result.v_infinity) / result.v_infinity;
    if (drift > 1e-6) {
        Logger::warn("Flyby v-infinity drift {:.3e} between entry and exit", drift);
    }
    return result;
}

FlybyPrediction GravityAssistAnalyzer::predict(const Vec3& v_approach, Real periapsis,
                                               const Vec3& v_planet, Real mu,
                                               const Vec3& normal) const
{
    FlybyPrediction prediction;
    Vec3 v_inf = v_approach - v_planet;
    Real speed = v_inf.length();
    Real axis_length = normal.length();
    if (mu <= 0.0 || periapsis <= 0.0 || speed <= 0.0 || axis_length <= 0.0 ||
        !v_inf.is_finite()) {
        return prediction;
    }

    prediction.v_infinity = speed;
    prediction.turning_angle = turning_angle(periapsis, speed, mu);
    prediction.eccentricity = 1.0 + periapsis * speed * speed / mu;
    prediction.b_parameter = b_parameter(periapsis, speed, mu);

    Vec3 v_out = math::rotate_about_axis(v_inf, normal / axis_length, prediction.turning_angle);
    prediction.exit_velocity = v_planet + v_out;
    prediction.delta_v = (prediction.exit_velocity - v_approach).length();
    prediction.valid = prediction.exit_velocity.is_finite();
    return prediction;
}

} // namespace conics::orbital
