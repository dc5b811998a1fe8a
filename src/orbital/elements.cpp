/**
 * @file elements.cpp
 * @brief Orbital elements implementation
 */

#include "conics/orbital/elements.h"
#include "conics/core/constants.h"
#include "conics/core/error.h"
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace conics::orbital {

// ============================================================================
// Frames
// ============================================================================

std::string to_string(const Frame& frame)
{
    if (frame.is_heliocentric()) {
        return "heliocentric";
    }
    return fmt::format("soi({})", frame.body);
}

void require_same_frame(const Frame& a, const Frame& b, const char* context)
{
    if (a != b) {
        throw FrameMismatchError(fmt::format("{}: {} vs {}", context, to_string(a), to_string(b)));
    }
}

// ============================================================================
// Classification
// ============================================================================

OrbitType classify_orbit(Real e)
{
    if (e < constants::CIRCULAR_CLASSIFICATION) return OrbitType::Circular;
    if (e < constants::NEAR_PARABOLIC_LOW) return OrbitType::Elliptic;
    if (e < constants::NEAR_PARABOLIC_HIGH) return OrbitType::NearParabolic;
    return OrbitType::Hyperbolic;
}

const char* orbit_type_name(OrbitType type)
{
    switch (type) {
        case OrbitType::Circular:      return "circular";
        case OrbitType::Elliptic:      return "elliptic";
        case OrbitType::NearParabolic: return "parabolic";
        case OrbitType::Hyperbolic:    return "hyperbolic";
    }
    return "unknown";
}

// ============================================================================
// OrbitalElements
// ============================================================================

OrbitalElements OrbitalElements::create(Real a, Real e, Real i, Real raan, Real arg_periapsis,
                                        Real mean_anomaly, Real epoch, Real mu)
{
    for (Real v : {a, e, i, raan, arg_periapsis, mean_anomaly, epoch, mu}) {
        if (!std::isfinite(v)) {
            throw std::invalid_argument("OrbitalElements: non-finite value");
        }
    }
    if (e < 0.0) {
        throw std::invalid_argument(fmt::format("OrbitalElements: negative eccentricity {}", e));
    }
    if (e == 1.0) {
        throw std::invalid_argument("OrbitalElements: parabolic eccentricity (e == 1)");
    }
    if (mu <= 0.0) {
        throw std::invalid_argument(fmt::format("OrbitalElements: mu must be positive, got {}", mu));
    }
    if (a == 0.0 || (a < 0.0) != (e > 1.0)) {
        throw std::invalid_argument(
            fmt::format("OrbitalElements: semi-major axis {} inconsistent with e = {}", a, e));
    }
    return OrbitalElements(a, e, i, raan, arg_periapsis, mean_anomaly, epoch, mu);
}

OrbitalElements OrbitalElements::from_degrees(Real a, Real e, Real i_deg, Real raan_deg,
                                              Real arg_periapsis_deg, Real mean_anomaly_deg,
                                              Real epoch, Real mu)
{
    using constants::DEG_TO_RAD;
    return create(a, e, i_deg * DEG_TO_RAD, raan_deg * DEG_TO_RAD,
                  arg_periapsis_deg * DEG_TO_RAD, mean_anomaly_deg * DEG_TO_RAD, epoch, mu);
}

Real OrbitalElements::mean_motion() const noexcept
{
    Real abs_a = std::abs(a_);
    return std::sqrt(mu_ / (abs_a * abs_a * abs_a));
}

Real OrbitalElements::periapsis() const noexcept
{
    return std::abs(a_) * std::abs(1.0 - e_);
}

Real OrbitalElements::apoapsis() const noexcept
{
    if (is_hyperbolic()) {
        return std::numeric_limits<Real>::infinity();
    }
    return a_ * (1.0 + e_);
}

std::optional<Real> OrbitalElements::period() const noexcept
{
    if (is_hyperbolic()) {
        return std::nullopt;
    }
    return constants::TWO_PI / mean_motion();
}

Real OrbitalElements::semi_latus_rectum() const noexcept
{
    Real p = is_hyperbolic() ? std::abs(a_) * (e_ * e_ - 1.0) : a_ * (1.0 - e_ * e_);
    return std::max(p, constants::MIN_SEMI_LATUS_RECTUM);
}

Real OrbitalElements::specific_energy() const noexcept
{
    return -mu_ / (2.0 * a_);
}

Vec3 OrbitalElements::orbit_normal() const noexcept
{
    Real si = std::sin(i_);
    return {si * std::sin(raan_), -si * std::cos(raan_), std::cos(i_)};
}

bool OrbitalElements::is_finite() const noexcept
{
    return std::isfinite(a_) && std::isfinite(e_) && std::isfinite(i_) &&
           std::isfinite(raan_) && std::isfinite(arg_periapsis_) &&
           std::isfinite(mean_anomaly_) && std::isfinite(epoch_) && std::isfinite(mu_);
}

} // namespace conics::orbital
