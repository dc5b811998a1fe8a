#pragma once
/**
 * @file config.h
 * @brief Configuration loading and management
 *
 * XML configuration for the engine, ship definitions and custom body
 * catalogs. Values may carry a unit attribute; they are converted to the
 * engine's units (AU, days, radians, kg, m^2) on load.
 */

#include "conics/bodies/body.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include "conics/orbital/intersection.h"
#include "conics/orbital/prediction.h"
#include "conics/orbital/propagator.h"
#include "conics/orbital/ship.h"
#include <string>
#include <vector>

namespace conics::config {

/**
 * @brief Engine configuration loaded from XML
 */
struct EngineConfig {
    // Simulation settings
    Real start_epoch{constants::DEFAULT_START_EPOCH};  ///< Julian date
    Real time_step{1.0};                ///< Largest single step, days
    Real time_scale{1.0};

    // Physics
    orbital::PropagatorSettings physics;

    // Prediction
    orbital::PredictionSettings prediction;
    Real cache_ttl_ms{constants::CACHE_TTL_MS};

    // Intersection search
    orbital::IntersectionSettings intersection;

    // Bodies; empty selects the built-in solar system
    std::string bodies_file;

    // Logging
    LogLevel log_level{LogLevel::Info};
    LogOutput log_output{LogOutput::Console};
    std::string log_directory{"logs"};

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error on a missing file, malformed XML or missing root
     */
    static EngineConfig load(const std::string& path);

    static EngineConfig defaults();

    bool save(const std::string& path) const;
};

/**
 * @brief Ship definition loaded from XML
 */
struct ShipConfig {
    std::string name{"ship"};
    Real mass_kg{constants::DEFAULT_SHIP_MASS};
    orbital::SailGeometry sail;
    orbital::PropulsionCommand command;

    // Initial orbit, relative to parent
    std::string parent;                 ///< Empty for heliocentric
    Real a{1.0};                        ///< AU
    Real e{0.0};
    Real i{0.0};                        ///< rad
    Real raan{0.0};
    Real arg_periapsis{0.0};
    Real mean_anomaly{0.0};
    Real epoch{0.0};                    ///< Julian date, 0 = engine start epoch

    /**
     * @throws std::runtime_error on a missing file, malformed XML or missing root
     */
    static ShipConfig load(const std::string& path);

    /**
     * @brief Build the ship state against a body catalog
     * @throws std::runtime_error if the parent body is unknown or has no SOI
     * @throws std::invalid_argument if the orbit is invalid
     */
    orbital::ShipState to_ship(const bodies::BodyCatalog& catalog, Real default_epoch) const;
};

/**
 * @brief Custom body catalog loaded from XML
 */
struct BodyCatalogConfig {
    /**
     * @brief Load a <bodies> document
     *
     * The first body without a parent is the primary. Orbits use the
     * parent's mu; parents must appear before their children.
     * @throws std::runtime_error on malformed input
     */
    static bodies::BodyCatalog load(const std::string& path);
};

/**
 * @brief Convert a value in the given unit to engine units
 *
 * Unknown or empty units leave the value unchanged.
 */
Real convert_to_engine_units(Real value, const std::string& unit);

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    EngineConfig load_engine_config(const std::string& path);
    ShipConfig load_ship_config(const std::string& path);
    bodies::BodyCatalog load_body_catalog(const std::string& path);

    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, or empty if not found
     */
    std::string find_file(const std::string& filename) const;

    const std::vector<std::string>& search_paths() const { return search_paths_; }

private:
    std::vector<std::string> search_paths_;
};

} // namespace conics::config
