#pragma once
/**
 * @file soi.h
 * @brief Sphere-of-influence transitions between reference frames
 *
 * Entry uses a swept segment-sphere test in body-relative coordinates so
 * fast ships cannot skip an SOI within one step. Exit uses a hysteresis
 * radius. Re-entry into the same body is suppressed for a cooldown period.
 */

#include "conics/bodies/body.h"
#include "conics/orbital/ship.h"
#include <optional>
#include <vector>

namespace conics::orbital {

struct SoiSettings {
    Real exit_hysteresis{1.01};         ///< Exit radius as a multiple of the SOI radius
    Real cooldown_days{0.1};            ///< Re-entry suppression per body
    Real extreme_eccentricity{50.0};    ///< Above this e the pass is flown as a straight line
    Real periapsis_multiplier{1.1};     ///< Safe periapsis as a multiple of the physical radius
};

enum class TransitionKind : UInt8 {
    Entry,
    Exit
};

/**
 * @brief Record of one frame change
 *
 * Heliocentric position and velocity before and after the conversion at
 * the same instant; they agree to rounding error.
 */
struct Transition {
    TransitionKind kind{TransitionKind::Entry};
    BodyId body{INVALID_BODY_ID};
    Real time{0.0};
    Vec3 helio_position_before;
    Vec3 helio_position_after;
    Vec3 helio_velocity_before;
    Vec3 helio_velocity_after;
    OrbitType orbit_type{OrbitType::Elliptic};
    Real eccentricity{0.0};
    bool extreme{false};                ///< Straight-line fallback engaged
};

/**
 * @brief SOI crossing found within a step
 */
struct EntryCandidate {
    BodyId body{INVALID_BODY_ID};
    Real fraction{0.0};                 ///< Position along the step, 0..1
    Real time{0.0};
    Real min_distance{0.0};             ///< Closest body-relative distance over the step
    Real gravity_strength{0.0};         ///< mu / min_distance^2
};

/**
 * @brief Result of the low-periapsis guard
 */
struct CollisionCorrection {
    Real original_periapsis{0.0};
    Real safe_radius{0.0};
};

class SOITransitionManager {
public:
    explicit SOITransitionManager(SoiSettings settings = {});

    const SoiSettings& settings() const { return settings_; }

    /**
     * @brief Find the dominant SOI entered between t0 and t1
     *
     * @param ship_p0 Heliocentric ship position at t0
     * @param ship_p1 Heliocentric ship position at t1
     * @param candidates Bodies to test; bodies without an SOI are ignored
     * @return Largest mu/r^2 among bodies entered and not in cooldown
     */
    std::optional<EntryCandidate> detect_entry(const Vec3& ship_p0, const Vec3& ship_p1,
                                               Real t0, Real t1,
                                               const bodies::BodyCatalog& catalog,
                                               const std::vector<BodyId>& candidates,
                                               const SoiBookkeeping& bookkeeping) const;

    /// Beyond the hysteresis radius of body
    bool should_exit(const Vec3& relative_position, const bodies::Body& body) const;

    bool in_cooldown(const SoiBookkeeping& bookkeeping, BodyId body, Real time) const;

    bool is_extreme(const OrbitalElements& elements) const {
        return elements.eccentricity() > settings_.extreme_eccentricity;
    }

    /**
     * @brief Convert a heliocentric ship state into the body frame and switch the ship
     *
     * @param helio Ship state at the entry instant (must be heliocentric)
     * @param body_helio Body state at the same instant (must be heliocentric)
     * @throws FrameMismatchError if either state is not heliocentric
     * @return nullopt if the converted state is not finite; ship unchanged
     */
    std::optional<Transition> enter(ShipState& ship, const bodies::Body& body,
                                    const StateVector& helio,
                                    const StateVector& body_helio) const;

    /**
     * @brief Convert a body-relative ship state back to heliocentric and switch the ship
     *
     * @param relative Ship state in the body's SOI frame
     * @param body_helio Body state at the same instant
     * @param primary_mu Gravitational parameter of the primary
     * @throws FrameMismatchError if relative is not in the ship's SOI frame
     */
    std::optional<Transition> exit(ShipState& ship, const StateVector& relative,
                                   const StateVector& body_helio, Real primary_mu) const;

    /**
     * @brief Replace an orbit whose periapsis is below the safe radius
     *
     * The ship keeps its radial direction, moves to the safe radius and
     * gets the circular speed in its current orbital plane.
     */
    std::optional<CollisionCorrection> enforce_safe_periapsis(ShipState& ship,
                                                              const bodies::Body& body,
                                                              const StateVector& relative) const;

    // ========================================================================
    // Frame Conversion
    // ========================================================================

    static StateVector helio_to_body(const StateVector& helio, const StateVector& body_helio,
                                     BodyId body);
    static StateVector body_to_helio(const StateVector& relative, const StateVector& body_helio);

private:
    SoiSettings settings_;
};

} // namespace conics::orbital
