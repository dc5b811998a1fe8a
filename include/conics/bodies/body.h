#pragma once
/**
 * @file body.h
 * @brief Celestial bodies, body catalog and ephemeris sources
 */

#include "conics/core/types.h"
#include "conics/orbital/elements.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conics::bodies {

// ============================================================================
// Body
// ============================================================================

enum class BodyType : UInt8 {
    Star,
    Planet,
    DwarfPlanet,
    Asteroid,
    Moon
};

const char* body_type_name(BodyType type);

/**
 * @brief Celestial body description
 *
 * Elements are relative to the parent body. The primary star has no
 * parent and no elements.
 */
struct Body {
    BodyId id{INVALID_BODY_ID};
    std::string name;
    BodyType type{BodyType::Planet};
    Real mu{0.0};                   ///< AU^3/day^2
    Real soi_radius{0.0};           ///< AU, 0 = no sphere of influence
    Real radius_km{0.0};            ///< Physical radius
    BodyId parent{INVALID_BODY_ID};
    std::optional<orbital::OrbitalElements> elements;

    bool has_soi() const { return soi_radius > 0.0 && mu > 0.0; }
    Real radius_au() const;
};

// ============================================================================
// Ephemeris Sources
// ============================================================================

/**
 * @brief External source of heliocentric body states
 *
 * Returning nullopt makes the catalog fall back to Keplerian propagation.
 */
class IEphemeris {
public:
    virtual ~IEphemeris() = default;

    virtual const std::string& name() const = 0;

    /**
     * @brief Heliocentric state of a top-level body
     */
    virtual std::optional<orbital::StateVector> heliocentric_state(const Body& body,
                                                                    Real time) const = 0;
};

/**
 * @brief Ephemeris from sampled positions and velocities
 *
 * Cubic Hermite interpolation between samples; nullopt outside the table.
 */
class TabulatedEphemeris : public IEphemeris {
public:
    TabulatedEphemeris();
    ~TabulatedEphemeris() override;

    const std::string& name() const override { return name_; }

    std::optional<orbital::StateVector> heliocentric_state(const Body& body,
                                                            Real time) const override;

    /**
     * @brief Add a sample; samples may arrive in any order
     */
    void add_sample(const std::string& body_name, Real time,
                    const Vec3& position, const Vec3& velocity);

    SizeT sample_count(const std::string& body_name) const;

private:
    struct Sample {
        Real time;
        Vec3 position;
        Vec3 velocity;
    };

    std::string name_{"Tabulated"};
    std::unordered_map<std::string, std::vector<Sample>> tables_;
};

// ============================================================================
// Body Catalog
// ============================================================================

/**
 * @brief Set of bodies with parent-chain state resolution
 */
class BodyCatalog {
public:
    BodyCatalog();
    ~BodyCatalog();

    BodyCatalog(const BodyCatalog&);
    BodyCatalog& operator=(const BodyCatalog&);
    BodyCatalog(BodyCatalog&&) noexcept;
    BodyCatalog& operator=(BodyCatalog&&) noexcept;

    /**
     * @brief Sun, planets, Ceres, Pluto and the major moons at J2000
     */
    static BodyCatalog solar_system();

    /**
     * @brief Add a body and assign its id
     * @throws std::invalid_argument on a duplicate name, unknown parent,
     *         or a non-primary body without elements
     */
    BodyId add(Body body);

    const Body* find(BodyId id) const;
    const Body* find(const std::string& name) const;

    /// @throws std::out_of_range for an unknown id
    const Body& get(BodyId id) const;

    const std::vector<Body>& bodies() const { return bodies_; }
    SizeT size() const { return bodies_.size(); }
    bool empty() const { return bodies_.empty(); }

    /// First body without a parent
    BodyId primary() const;

    /// Bodies with a sphere of influence
    std::vector<BodyId> soi_bodies() const;

    /**
     * @brief State relative to the parent body
     */
    orbital::StateVector relative_state(BodyId id, Real time) const;

    /**
     * @brief Heliocentric state, resolving the parent chain
     */
    orbital::StateVector heliocentric_state(BodyId id, Real time) const;

    void set_ephemeris(std::shared_ptr<const IEphemeris> ephemeris) { ephemeris_ = std::move(ephemeris); }
    const IEphemeris* ephemeris() const { return ephemeris_.get(); }

private:
    std::vector<Body> bodies_;
    std::unordered_map<std::string, BodyId> by_name_;
    std::shared_ptr<const IEphemeris> ephemeris_;
};

} // namespace conics::bodies
