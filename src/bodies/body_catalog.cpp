/**
 * @file body_catalog.cpp
 * @brief Body catalog and built-in solar system data
 */

#include "conics/bodies/body.h"
#include "conics/core/constants.h"
#include "conics/orbital/conversion.h"
#include <fmt/format.h>
#include <stdexcept>

namespace conics::bodies {

using namespace constants;
using orbital::OrbitalElements;
using orbital::StateVector;
using orbital::Frame;

namespace {

// Gravitational parameters (AU^3/day^2)
constexpr Real MU_MERCURY = 4.9125e-12;
constexpr Real MU_VENUS   = 7.2435e-10;
constexpr Real MU_EARTH   = 8.887692445e-10;
constexpr Real MU_MARS    = 9.549535105e-11;
constexpr Real MU_JUPITER = 2.824760519e-7;
constexpr Real MU_SATURN  = 8.4597151e-8;
constexpr Real MU_URANUS  = 1.2920249e-8;
constexpr Real MU_NEPTUNE = 1.5243596e-8;
constexpr Real MU_PLUTO   = 1.96e-12;

// Gameplay sphere-of-influence radii (AU)
constexpr Real SOI_INNER   = 0.1;
constexpr Real SOI_JUPITER = 0.4;

struct CatalogEntry {
    const char* name;
    BodyType type;
    const char* parent;
    Real mu;
    Real soi;
    Real radius_km;
    // a, e, i, raan, argp, M0 (degrees) at J2000
    Real el[6];
};

// Orbits of moons use the parent's mu as central body
const CatalogEntry SOLAR_SYSTEM[] = {
    {"MERCURY", BodyType::Planet, nullptr, MU_MERCURY, SOI_INNER, 2440,
        {0.387098, 0.205630, 7.005, 48.331, 29.124, 174.796}},
    {"VENUS", BodyType::Planet, nullptr, MU_VENUS, SOI_INNER, 6052,
        {0.723332, 0.006772, 3.39458, 76.680, 54.884, 50.115}},
    {"EARTH", BodyType::Planet, nullptr, MU_EARTH, SOI_INNER, 6371,
        {1.000001018, 0.0167086, 0.00005, -11.26064, 114.20783, 358.617}},
    {"MARS", BodyType::Planet, nullptr, MU_MARS, SOI_INNER, 3390,
        {1.523679, 0.0934, 1.850, 49.558, 286.502, 19.373}},
    {"JUPITER", BodyType::Planet, nullptr, MU_JUPITER, SOI_JUPITER, 69911,
        {5.2044, 0.0489, 1.303, 100.464, 273.867, 20.020}},
    {"SATURN", BodyType::Planet, nullptr, MU_SATURN, 0.0, 58232,
        {9.5826, 0.0565, 2.485, 113.665, 339.392, 317.020}},
    {"URANUS", BodyType::Planet, nullptr, MU_URANUS, 0.0, 25362,
        {19.2184, 0.0457, 0.773, 74.006, 96.998, 142.238}},
    {"NEPTUNE", BodyType::Planet, nullptr, MU_NEPTUNE, 0.0, 24622,
        {30.110387, 0.0113, 1.770, 131.784, 276.336, 256.228}},
    {"CERES", BodyType::DwarfPlanet, nullptr, 0.0, 0.0, 476,
        {2.7691651, 0.0760090, 10.59406, 80.3055, 73.5977, 77.372}},
    {"PLUTO", BodyType::DwarfPlanet, nullptr, MU_PLUTO, 0.0, 1188,
        {39.48211675, 0.24882730, 17.14001206, 110.299149, 113.76329, 14.862059}},
    {"LUNA", BodyType::Moon, "EARTH", 0.0, 0.0, 1737,
        {0.00257, 0.0549, 5.145, 125.08, 318.15, 135.27}},
    {"PHOBOS", BodyType::Moon, "MARS", 0.0, 0.0, 11,
        {0.0000629, 0.0151, 1.093, 16.946, 150.057, 91.059}},
    {"IO", BodyType::Moon, "JUPITER", 0.0, 0.0, 1822,
        {0.002819, 0.0041, 0.050, 43.977, 84.129, 342.021}},
    {"EUROPA", BodyType::Moon, "JUPITER", 0.0, 0.0, 1561,
        {0.004486, 0.0094, 0.470, 219.106, 88.970, 171.016}},
    {"GANYMEDE", BodyType::Moon, "JUPITER", 0.0, 0.0, 2634,
        {0.00716, 0.0013, 0.20, 63.552, 192.417, 317.54}},
    {"CALLISTO", BodyType::Moon, "JUPITER", 0.0, 0.0, 2410,
        {0.01259, 0.0074, 0.192, 298.848, 52.643, 181.408}},
    {"TITAN", BodyType::Moon, "SATURN", 0.0, 0.0, 2575,
        {0.008168, 0.0288, 0.348, 28.056, 180.532, 163.28}},
    {"CHARON", BodyType::Moon, "PLUTO", 0.0, 0.0, 606,
        {0.000131, 0.0022, 0.001, 223.046, 146.596, 147.848}},
};

constexpr Real SUN_RADIUS_KM = 696000.0;

} // anonymous namespace

const char* body_type_name(BodyType type)
{
    switch (type) {
        case BodyType::Star:        return "star";
        case BodyType::Planet:      return "planet";
        case BodyType::DwarfPlanet: return "dwarf";
        case BodyType::Asteroid:    return "asteroid";
        case BodyType::Moon:        return "moon";
    }
    return "unknown";
}

Real Body::radius_au() const
{
    return radius_km / AU_KM;
}

// ============================================================================
// BodyCatalog
// ============================================================================

BodyCatalog::BodyCatalog() = default;
BodyCatalog::~BodyCatalog() = default;
BodyCatalog::BodyCatalog(const BodyCatalog&) = default;
BodyCatalog& BodyCatalog::operator=(const BodyCatalog&) = default;
BodyCatalog::BodyCatalog(BodyCatalog&&) noexcept = default;
BodyCatalog& BodyCatalog::operator=(BodyCatalog&&) noexcept = default;

BodyCatalog BodyCatalog::solar_system()
{
    BodyCatalog catalog;

    Body sun;
    sun.name = "SOL";
    sun.type = BodyType::Star;
    sun.mu = MU_SUN;
    sun.radius_km = SUN_RADIUS_KM;
    catalog.add(std::move(sun));

    for (const auto& entry : SOLAR_SYSTEM) {
        Body body;
        body.name = entry.name;
        body.type = entry.type;
        body.mu = entry.mu;
        body.soi_radius = entry.soi;
        body.radius_km = entry.radius_km;

        Real central_mu = MU_SUN;
        if (entry.parent) {
            const Body* parent = catalog.find(entry.parent);
            body.parent = parent->id;
            central_mu = parent->mu;
        } else {
            body.parent = catalog.primary();
        }

        body.elements = OrbitalElements::from_degrees(
            entry.el[0], entry.el[1], entry.el[2], entry.el[3], entry.el[4], entry.el[5],
            J2000, central_mu);
        catalog.add(std::move(body));
    }
    return catalog;
}

BodyId BodyCatalog::add(Body body)
{
    if (body.name.empty() || by_name_.count(body.name) > 0) {
        throw std::invalid_argument(fmt::format("BodyCatalog: duplicate or empty name '{}'", body.name));
    }
    if (body.parent != INVALID_BODY_ID) {
        if (body.parent >= bodies_.size()) {
            throw std::invalid_argument(fmt::format("BodyCatalog: unknown parent for '{}'", body.name));
        }
        if (!body.elements) {
            throw std::invalid_argument(fmt::format("BodyCatalog: '{}' has a parent but no elements", body.name));
        }
    }

    body.id = static_cast<BodyId>(bodies_.size());
    by_name_[body.name] = body.id;
    bodies_.push_back(std::move(body));
    return bodies_.back().id;
}

const Body* BodyCatalog::find(BodyId id) const
{
    return id < bodies_.size() ? &bodies_[id] : nullptr;
}

const Body* BodyCatalog::find(const std::string& name) const
{
    auto it = by_name_.find(name);
    return it != by_name_.end() ? &bodies_[it->second] : nullptr;
}

const Body& BodyCatalog::get(BodyId id) const
{
    if (id >= bodies_.size()) {
        throw std::out_of_range(fmt::format("BodyCatalog: unknown body id {}", id));
    }
    return bodies_[id];
}

BodyId BodyCatalog::primary() const
{
    for (const auto& body : bodies_) {
        if (body.parent == INVALID_BODY_ID) {
            return body.id;
        }
    }
    return INVALID_BODY_ID;
}

std::vector<BodyId> BodyCatalog::soi_bodies() const
{
    std::vector<BodyId> ids;
    for (const auto& body : bodies_) {
        if (body.has_soi() && body.parent != INVALID_BODY_ID) {
            ids.push_back(body.id);
        }
    }
    return ids;
}

StateVector BodyCatalog::relative_state(BodyId id, Real time) const
{
    const Body& body = get(id);
    if (!body.elements) {
        StateVector origin;
        origin.time = time;
        return origin;
    }
    return orbital::elements_to_state(*body.elements, time, Frame::heliocentric());
}

StateVector BodyCatalog::heliocentric_state(BodyId id, Real time) const
{
    const Body& body = get(id);
    if (!body.elements) {
        StateVector origin;
        origin.time = time;
        return origin;
    }

    const Body* parent = find(body.parent);
    bool top_level = parent == nullptr || parent->parent == INVALID_BODY_ID;

    if (top_level && ephemeris_) {
        if (auto state = ephemeris_->heliocentric_state(body, time)) {
            state->frame = Frame::heliocentric();
            return *state;
        }
    }

    StateVector state = relative_state(id, time);
    if (!top_level) {
        StateVector parent_state = heliocentric_state(parent->id, time);
        state.position += parent_state.position;
        state.velocity += parent_state.velocity;
    }
    return state;
}

} // namespace conics::bodies
