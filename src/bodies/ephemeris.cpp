/**
 * @file ephemeris.cpp
 * @brief Tabulated ephemeris
 */

#include "conics/bodies/body.h"
#include <algorithm>

namespace conics::bodies {

TabulatedEphemeris::TabulatedEphemeris() = default;
TabulatedEphemeris::~TabulatedEphemeris() = default;

void TabulatedEphemeris::add_sample(const std::string& body_name, Real time,
                                    const Vec3& position, const Vec3& velocity)
{
    auto& table = tables_[body_name];
    Sample sample{time, position, velocity};
    auto it = std::lower_bound(table.begin(), table.end(), time,
                               [](const Sample& s, Real t) { return s.time < t; });
    if (it != table.end() && it->time == time) {
        *it = sample;
    } else {
        table.insert(it, sample);
    }
}

SizeT TabulatedEphemeris::sample_count(const std::string& body_name) const
{
    auto it = tables_.find(body_name);
    return it != tables_.end() ? it->second.size() : 0;
}

std::optional<orbital::StateVector> TabulatedEphemeris::heliocentric_state(const Body& body,
                                                                            Real time) const
{
    auto it = tables_.find(body.name);
    if (it == tables_.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& table = it->second;
    if (time < table.front().time || time > table.back().time) {
        return std::nullopt;
    }

    orbital::StateVector state;
    state.time = time;

    auto upper = std::lower_bound(table.begin(), table.end(), time,
                                  [](const Sample& s, Real t) { return s.time < t; });
    if (upper->time == time) {
        state.position = upper->position;
        state.velocity = upper->velocity;
        return state;
    }

    const Sample& s0 = *(upper - 1);
    const Sample& s1 = *upper;
    Real h = s1.time - s0.time;
    Real u = (time - s0.time) / h;
    Real u2 = u * u;
    Real u3 = u2 * u;

    // Cubic Hermite basis
    Real h00 = 2.0 * u3 - 3.0 * u2 + 1.0;
    Real h10 = u3 - 2.0 * u2 + u;
    Real h01 = -2.0 * u3 + 3.0 * u2;
    Real h11 = u3 - u2;
    state.position = s0.position * h00 + s0.velocity * (h10 * h) +
                     s1.position * h01 + s1.velocity * (h11 * h);

    // Derivative of the basis, divided by h
    Real d00 = (6.0 * u2 - 6.0 * u) / h;
    Real d10 = 3.0 * u2 - 4.0 * u + 1.0;
    Real d01 = (-6.0 * u2 + 6.0 * u) / h;
    Real d11 = 3.0 * u2 - 2.0 * u;
    state.velocity = s0.position * d00 + s0.velocity * d10 +
                     s1.position * d01 + s1.velocity * d11;
    return state;
}

} // namespace conics::bodies
