#pragma once
/**
 * @file elements.h
 * @brief Orbital elements, reference frames and state vectors
 *
 * OrbitalElements is an immutable value: it is produced whole by the
 * validating factory or by state-vector conversion, never edited in place.
 */

#include "conics/core/types.h"
#include <optional>
#include <string>

namespace conics::orbital {

// ============================================================================
// Reference Frames
// ============================================================================

enum class FrameKind : UInt8 {
    Heliocentric,   ///< Centered on the primary star
    InSOI           ///< Centered on a body whose sphere of influence contains the ship
};

/**
 * @brief Tagged reference frame
 */
struct Frame {
    FrameKind kind{FrameKind::Heliocentric};
    BodyId body{INVALID_BODY_ID};   ///< Central body when kind == InSOI

    static constexpr Frame heliocentric() noexcept { return {}; }
    static constexpr Frame in_soi(BodyId id) noexcept { return {FrameKind::InSOI, id}; }

    constexpr bool is_heliocentric() const noexcept { return kind == FrameKind::Heliocentric; }

    constexpr bool operator==(const Frame& other) const noexcept {
        return kind == other.kind && (kind == FrameKind::Heliocentric || body == other.body);
    }
    constexpr bool operator!=(const Frame& other) const noexcept { return !(*this == other); }
};

std::string to_string(const Frame& frame);

/**
 * @brief Throw FrameMismatchError unless the frames are equal
 */
void require_same_frame(const Frame& a, const Frame& b, const char* context);

// ============================================================================
// Orbit Classification
// ============================================================================

enum class OrbitType : UInt8 {
    Circular,       ///< e < 1e-6
    Elliptic,       ///< e < 0.9999
    NearParabolic,  ///< e < 1.0001
    Hyperbolic
};

OrbitType classify_orbit(Real eccentricity);
const char* orbit_type_name(OrbitType type);

// ============================================================================
// Orbital Elements
// ============================================================================

namespace detail {
struct ElementsAccess;
}

/**
 * @brief Classical Keplerian elements relative to a central body
 *
 * Units: a in AU (negative for hyperbolic), angles in radians,
 * epoch as Julian date, mu in AU^3/day^2.
 * Invariant: a < 0 exactly when e >= 1, and e != 1.
 */
class OrbitalElements {
public:
    /**
     * @brief Validating factory
     * @throws std::invalid_argument on non-finite input, e < 0, e == 1,
     *         mu <= 0, a == 0, or a sign that disagrees with e
     */
    static OrbitalElements create(Real a, Real e, Real i, Real raan, Real arg_periapsis,
                                  Real mean_anomaly, Real epoch, Real mu);

    /**
     * @brief Catalog factory taking angles in degrees
     */
    static OrbitalElements from_degrees(Real a, Real e, Real i_deg, Real raan_deg,
                                        Real arg_periapsis_deg, Real mean_anomaly_deg,
                                        Real epoch, Real mu);

    Real semi_major_axis() const noexcept { return a_; }
    Real eccentricity() const noexcept { return e_; }
    Real inclination() const noexcept { return i_; }
    Real raan() const noexcept { return raan_; }
    Real arg_periapsis() const noexcept { return arg_periapsis_; }
    Real mean_anomaly_at_epoch() const noexcept { return mean_anomaly_; }
    Real epoch() const noexcept { return epoch_; }
    Real mu() const noexcept { return mu_; }

    bool is_hyperbolic() const noexcept { return e_ >= 1.0; }
    OrbitType orbit_type() const noexcept { return classify_orbit(e_); }

    /// Radians per day
    Real mean_motion() const noexcept;

    /// |a| * |1 - e|
    Real periapsis() const noexcept;

    /// a * (1 + e), infinity for hyperbolic orbits
    Real apoapsis() const noexcept;

    /// Days, nullopt for hyperbolic orbits
    std::optional<Real> period() const noexcept;

    /// p = a(1 - e^2), floored at 1e-12
    Real semi_latus_rectum() const noexcept;

    /// -mu / 2a
    Real specific_energy() const noexcept;

    /// Unit orbit normal in the parent frame
    Vec3 orbit_normal() const noexcept;

    bool is_finite() const noexcept;

private:
    friend struct detail::ElementsAccess;

    OrbitalElements(Real a, Real e, Real i, Real raan, Real arg_periapsis,
                    Real mean_anomaly, Real epoch, Real mu) noexcept
        : a_(a), e_(e), i_(i), raan_(raan), arg_periapsis_(arg_periapsis),
          mean_anomaly_(mean_anomaly), epoch_(epoch), mu_(mu) {}

    Real a_;
    Real e_;
    Real i_;
    Real raan_;
    Real arg_periapsis_;
    Real mean_anomaly_;
    Real epoch_;
    Real mu_;
};

namespace detail {

/**
 * @brief Unchecked construction, reserved for the state-vector converter
 *
 * The converter enforces the invariants itself and reports non-finite
 * results as nullopt. Not part of the public API.
 */
struct ElementsAccess {
    static OrbitalElements make(Real a, Real e, Real i, Real raan, Real arg_periapsis,
                                Real mean_anomaly, Real epoch, Real mu) noexcept {
        return OrbitalElements(a, e, i, raan, arg_periapsis, mean_anomaly, epoch, mu);
    }
};

} // namespace detail

// ============================================================================
// State Vector
// ============================================================================

/**
 * @brief Cartesian state tagged with its reference frame
 */
struct StateVector {
    Vec3 position;          ///< AU
    Vec3 velocity;          ///< AU/day
    Frame frame;
    Real time{0.0};         ///< Julian date

    bool is_finite() const noexcept {
        return position.is_finite() && velocity.is_finite();
    }
};

} // namespace conics::orbital
