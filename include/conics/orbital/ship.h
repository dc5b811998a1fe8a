#pragma once
/**
 * @file ship.h
 * @brief Ship state carried between physics steps
 */

#include "conics/orbital/elements.h"
#include "conics/orbital/thrust.h"
#include <optional>
#include <string>
#include <unordered_map>

namespace conics::orbital {

/**
 * @brief Straight-line fallback for extreme-eccentricity SOI passes
 *
 * Position and velocity are relative to the SOI body.
 */
struct ExtremeFlyby {
    Vec3 entry_position;
    Vec3 entry_velocity;
    Real entry_time{0.0};

    Vec3 position_at(Real time) const { return entry_position + entry_velocity * (time - entry_time); }
};

/**
 * @brief Per-ship sphere-of-influence bookkeeping
 */
struct SoiBookkeeping {
    std::unordered_map<BodyId, Real> last_transition;   ///< Per-body time of the last transition
    BodyId last_body{INVALID_BODY_ID};
    Real last_time{0.0};

    /// Time of the last transition involving body, or nullopt
    std::optional<Real> last_transition_with(BodyId body) const {
        auto it = last_transition.find(body);
        if (it == last_transition.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void record(BodyId body, Real time) {
        last_transition[body] = time;
        last_body = body;
        last_time = time;
    }
};

/**
 * @brief Complete dynamic state of one ship
 */
struct ShipState {
    std::string name;
    OrbitalElements elements;               ///< Relative to frame's central body
    Frame frame;
    Real mass_kg{10000.0};
    SailGeometry sail;
    SoiBookkeeping soi;
    std::optional<ExtremeFlyby> extreme_flyby;

    ShipState(std::string ship_name, const OrbitalElements& orbit, Frame ship_frame = Frame::heliocentric())
        : name(std::move(ship_name)), elements(orbit), frame(ship_frame) {}
};

} // namespace conics::orbital
