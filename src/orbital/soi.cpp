/**
 * @file soi.cpp
 * @brief Sphere-of-influence transition handling
 */

#include "conics/orbital/soi.h"
#include "conics/orbital/conversion.h"
#include "conics/core/constants.h"
#include "conics/core/error.h"
#include "conics/core/logger.h"
#include <algorithm>
#include <cmath>

namespace conics::orbital {

namespace {

/// Periapsis within this relative margin of the safe radius counts as safe
constexpr Real PERIAPSIS_MARGIN = 1e-6;

/// Unit normal of the plane containing r and v, or a perpendicular to r
Vec3 plane_normal(const Vec3& r_hat, const Vec3& velocity)
{
    Vec3 h = r_hat.cross(velocity);
    if (h.length() > 1e-10 * velocity.length() && h.length() > 0.0) {
        return h.normalized();
    }
    Vec3 n = r_hat.cross(Vec3::UnitZ());
    if (n.length_squared() < 1e-20) {
        n = r_hat.cross(Vec3::UnitX());
    }
    // Keep prograde orientation about +z where possible
    n = n.normalized();
    return n.z < 0.0 ? -n : n;
}

} // anonymous namespace

SOITransitionManager::SOITransitionManager(SoiSettings settings)
    : settings_(settings)
{
}

// ============================================================================
// Detection
// ============================================================================

bool SOITransitionManager::in_cooldown(const SoiBookkeeping& bookkeeping, BodyId body, Real time) const
{
    auto last = bookkeeping.last_transition_with(body);
    return last && (time - *last) < settings_.cooldown_days && (time - *last) >= 0.0;
}

std::optional<EntryCandidate> SOITransitionManager::detect_entry(
    const Vec3& ship_p0, const Vec3& ship_p1, Real t0, Real t1,
    const bodies::BodyCatalog& catalog, const std::vector<BodyId>& candidates,
    const SoiBookkeeping& bookkeeping) const
{
    std::optional<EntryCandidate> best;

    for (BodyId id : candidates) {
        const bodies::Body* body = catalog.find(id);
        if (!body || !body->has_soi() || body->parent == INVALID_BODY_ID) {
            continue;
        }

        Vec3 b0 = catalog.heliocentric_state(id, t0).position;
        Vec3 b1 = catalog.heliocentric_state(id, t1).position;
        Vec3 rel0 = ship_p0 - b0;
        Vec3 rel1 = ship_p1 - b1;
        Vec3 d = rel1 - rel0;
        Real radius = body->soi_radius;

        Real a = d.length_squared();
        Real fraction = -1.0;
        if (rel0.length() < radius) {
            fraction = 0.0;
        } else if (a > 1e-30) {
            Real b = 2.0 * rel0.dot(d);
            Real c = rel0.length_squared() - radius * radius;
            Real disc = b * b - 4.0 * a * c;
            if (disc >= 0.0) {
                Real s = (-b - std::sqrt(disc)) / (2.0 * a);
                if (s >= 0.0 && s <= 1.0) {
                    fraction = s;
                }
            }
        }
        if (fraction < 0.0) {
            continue;
        }

        Real entry_time = t0 + fraction * (t1 - t0);
        if (in_cooldown(bookkeeping, id, entry_time)) {
            continue;
        }

        Real s_min = (a > 1e-30) ? std::clamp(-rel0.dot(d) / a, 0.0, 1.0) : 0.0;
        Real min_distance = std::max((rel0 + d * s_min).length(), 1e-12);

        EntryCandidate candidate;
        candidate.body = id;
        candidate.fraction = fraction;
        candidate.time = entry_time;
        candidate.min_distance = min_distance;
        candidate.gravity_strength = body->mu / (min_distance * min_distance);

        if (!best || candidate.gravity_strength > best->gravity_strength ||
            (candidate.gravity_strength == best->gravity_strength && candidate.body < best->body)) {
            best = candidate;
        }
    }
    return best;
}

bool SOITransitionManager::should_exit(const Vec3& relative_position, const bodies::Body& body) const
{
    if (!body.has_soi()) {
        return true;
    }
    return relative_position.length() > body.soi_radius * settings_.exit_hysteresis;
}

// ============================================================================
// Frame Conversion
// ============================================================================

StateVector SOITransitionManager::helio_to_body(const StateVector& helio, const StateVector& body_helio,
                                                BodyId body)
{
    require_same_frame(helio.frame, Frame::heliocentric(), "helio_to_body ship state");
    require_same_frame(body_helio.frame, Frame::heliocentric(), "helio_to_body body state");

    StateVector relative;
    relative.position = helio.position - body_helio.position;
    relative.velocity = helio.velocity - body_helio.velocity;
    relative.frame = Frame::in_soi(body);
    relative.time = helio.time;
    return relative;
}

StateVector SOITransitionManager::body_to_helio(const StateVector& relative, const StateVector& body_helio)
{
    if (relative.frame.is_heliocentric()) {
        throw FrameMismatchError("body_to_helio: state is already heliocentric");
    }
    require_same_frame(body_helio.frame, Frame::heliocentric(), "body_to_helio body state");

    StateVector helio;
    helio.position = relative.position + body_helio.position;
    helio.velocity = relative.velocity + body_helio.velocity;
    helio.frame = Frame::heliocentric();
    helio.time = relative.time;
    return helio;
}

// ============================================================================
// Transitions
// ============================================================================

std::optional<Transition> SOITransitionManager::enter(ShipState& ship, const bodies::Body& body,
                                                      const StateVector& helio,
                                                      const StateVector& body_helio) const
{
    StateVector relative = helio_to_body(helio, body_helio, body.id);
    auto elements = state_to_elements(relative, body.mu);
    if (!elements) {
        Logger::warn("SOI entry into {} rejected: non-finite state", body.name);
        return std::nullopt;
    }

    Transition transition;
    transition.kind = TransitionKind::Entry;
    transition.body = body.id;
    transition.time = helio.time;
    transition.helio_position_before = helio.position;
    transition.helio_velocity_before = helio.velocity;
    transition.orbit_type = elements->orbit_type();
    transition.eccentricity = elements->eccentricity();
    transition.extreme = is_extreme(*elements);

    ship.elements = *elements;
    ship.frame = relative.frame;
    ship.soi.record(body.id, helio.time);

    if (transition.extreme) {
        ship.extreme_flyby = ExtremeFlyby{relative.position, relative.velocity, helio.time};
        transition.helio_position_after = body_helio.position + relative.position;
        transition.helio_velocity_after = body_helio.velocity + relative.velocity;
        Logger::info("{} entered SOI of {} on an extreme flyby (e={:.2f}), using straight-line motion",
                     ship.name, body.name, transition.eccentricity);
    } else {
        ship.extreme_flyby.reset();
        StateVector check = elements_to_state(*elements, helio.time, ship.frame);
        transition.helio_position_after = body_helio.position + check.position;
        transition.helio_velocity_after = body_helio.velocity + check.velocity;
        Logger::info("{} entered SOI of {} ({} orbit, e={:.4f})", ship.name, body.name,
                     orbit_type_name(transition.orbit_type), transition.eccentricity);
    }
    return transition;
}

std::optional<Transition> SOITransitionManager::exit(ShipState& ship, const StateVector& relative,
                                                     const StateVector& body_helio, Real primary_mu) const
{
    require_same_frame(relative.frame, ship.frame, "SOI exit");
    StateVector helio = body_to_helio(relative, body_helio);

    auto elements = state_to_elements(helio, primary_mu);
    if (!elements) {
        Logger::warn("SOI exit of {} rejected: non-finite state", ship.name);
        return std::nullopt;
    }

    Transition transition;
    transition.kind = TransitionKind::Exit;
    transition.body = relative.frame.body;
    transition.time = relative.time;
    transition.helio_position_before = helio.position;
    transition.helio_velocity_before = helio.velocity;
    transition.orbit_type = elements->orbit_type();
    transition.eccentricity = elements->eccentricity();

    ship.elements = *elements;
    ship.frame = Frame::heliocentric();
    ship.extreme_flyby.reset();
    ship.soi.record(transition.body, relative.time);

    StateVector check = elements_to_state(*elements, relative.time);
    transition.helio_position_after = check.position;
    transition.helio_velocity_after = check.velocity;

    Logger::info("{} left SOI of body {} (heliocentric e={:.4f})", ship.name, transition.body,
                 transition.eccentricity);
    return transition;
}

std::optional<CollisionCorrection> SOITransitionManager::enforce_safe_periapsis(
    ShipState& ship, const bodies::Body& body, const StateVector& relative) const
{
    require_same_frame(relative.frame, Frame::in_soi(body.id), "periapsis guard");

    Real safe_radius = body.radius_au() * settings_.periapsis_multiplier;
    Real periapsis = ship.elements.periapsis();
    if (safe_radius <= 0.0 || periapsis >= safe_radius * (1.0 - PERIAPSIS_MARGIN)) {
        return std::nullopt;
    }

    Vec3 r_hat = relative.position.length() > 0.0 ? relative.position.normalized() : Vec3::UnitX();
    Vec3 normal = plane_normal(r_hat, relative.velocity);
    Vec3 t_hat = normal.cross(r_hat);
    Real speed = std::sqrt(body.mu / safe_radius);

    auto elements = state_to_elements(r_hat * safe_radius, t_hat * speed, body.mu, relative.time);
    if (!elements) {
        return std::nullopt;
    }

    ship.elements = *elements;
    ship.extreme_flyby.reset();
    Logger::warn("{}: periapsis {:.1f} km below safe radius {:.1f} km at {}, circularized",
                 ship.name, periapsis * constants::AU_KM, safe_radius * constants::AU_KM, body.name);
    return CollisionCorrection{periapsis, safe_radius};
}

} // namespace conics::orbital
