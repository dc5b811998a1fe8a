/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Engine settings, ship definitions and body catalogs read with pugixml.
 */

#include "conics/interface/config.h"
#include <pugixml.hpp>
#include <filesystem>
#include <stdexcept>

namespace conics::config {

using namespace constants;

namespace {

// ============================================================================
// Parsing Helpers
// ============================================================================

Real parse_value_with_unit(const pugi::xml_node& node, Real fallback,
                           const char* default_unit = "") {
    if (!node) {
        return fallback;
    }
    Real value = node.text().as_double(fallback);
    std::string unit = node.attribute("unit").as_string(default_unit);
    return convert_to_engine_units(value, unit);
}

pugi::xml_node load_root(pugi::xml_document& doc, const std::string& path,
                         const char* root_name, const char* what) {
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::runtime_error(std::string("Failed to load ") + what + ": " +
                                 result.description());
    }
    auto root = doc.child(root_name);
    if (!root) {
        throw std::runtime_error(std::string("Invalid ") + what + " XML: no <" +
                                 root_name + "> root element");
    }
    return root;
}

bodies::BodyType parse_body_type(const std::string& type) {
    if (type == "star") return bodies::BodyType::Star;
    if (type == "dwarf" || type == "dwarf_planet") return bodies::BodyType::DwarfPlanet;
    if (type == "asteroid") return bodies::BodyType::Asteroid;
    if (type == "moon") return bodies::BodyType::Moon;
    return bodies::BodyType::Planet;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "info";
}

const char* log_output_name(LogOutput output) {
    switch (output) {
        case LogOutput::Console: return "console";
        case LogOutput::File:    return "file";
        case LogOutput::Both:    return "both";
    }
    return "console";
}

} // anonymous namespace

// ============================================================================
// Unit Conversion
// ============================================================================

Real convert_to_engine_units(Real value, const std::string& unit) {
    // Length to AU
    if (unit == "AU" || unit == "au") return value;
    if (unit == "km") return value / AU_KM;
    if (unit == "m") return value / AU_M;

    // Angle to radians
    if (unit == "deg") return value * DEG_TO_RAD;
    if (unit == "rad") return value;

    // Time to days
    if (unit == "day" || unit == "d") return value;
    if (unit == "h") return value / 24.0;
    if (unit == "s") return value / SECONDS_PER_DAY;

    // Area to m^2
    if (unit == "m2" || unit == "m^2") return value;
    if (unit == "km2" || unit == "km^2") return value * 1.0e6;

    // Mass to kg
    if (unit == "kg") return value;
    if (unit == "t") return value * 1000.0;

    // Gravitational parameter to AU^3/day^2
    if (unit == "AU3/day2" || unit == "AU^3/day^2") return value;
    if (unit == "km3/s2" || unit == "km^3/s^2") {
        return value * SECONDS_PER_DAY * SECONDS_PER_DAY / (AU_KM * AU_KM * AU_KM);
    }

    // Speed to AU/day
    if (unit == "AU/day") return value;
    if (unit == "km/s") return value * KMS_TO_AU_PER_DAY;

    return value;
}

// ============================================================================
// EngineConfig Implementation
// ============================================================================

EngineConfig EngineConfig::load(const std::string& path) {
    pugi::xml_document doc;
    auto root = load_root(doc, path, "engine_config", "engine config");

    EngineConfig config = defaults();

    if (auto sim = root.child("simulation")) {
        config.start_epoch = sim.child("start_epoch").text().as_double(config.start_epoch);
        config.time_step = parse_value_with_unit(sim.child("time_step"), config.time_step);
        config.time_scale = sim.child("time_scale").text().as_double(config.time_scale);
    }

    if (auto physics = root.child("physics")) {
        auto& soi = config.physics.soi;
        soi.cooldown_days = parse_value_with_unit(physics.child("soi_cooldown"), soi.cooldown_days);
        soi.exit_hysteresis = physics.child("soi_exit_hysteresis").text().as_double(soi.exit_hysteresis);
        soi.extreme_eccentricity =
            physics.child("extreme_eccentricity").text().as_double(soi.extreme_eccentricity);
        soi.periapsis_multiplier =
            physics.child("periapsis_multiplier").text().as_double(soi.periapsis_multiplier);
        config.physics.min_thrust =
            physics.child("min_thrust").text().as_double(config.physics.min_thrust);
        config.physics.sun_approach_radius = parse_value_with_unit(
            physics.child("sun_approach_radius"), config.physics.sun_approach_radius);
    }

    if (auto pred = root.child("prediction")) {
        auto& p = config.prediction;
        p.duration_default = parse_value_with_unit(pred.child("duration_default"), p.duration_default);
        p.duration_min = parse_value_with_unit(pred.child("duration_min"), p.duration_min);
        p.duration_max = parse_value_with_unit(pred.child("duration_max"), p.duration_max);
        p.steps_default = pred.child("steps_default").text().as_int(p.steps_default);
        p.scale_steps_with_duration =
            pred.child("scale_steps").text().as_bool(p.scale_steps_with_duration);
        p.steps_per_day = pred.child("steps_per_day").text().as_double(p.steps_per_day);
        p.steps_min = pred.child("steps_min").text().as_int(p.steps_min);
        p.steps_max = pred.child("steps_max").text().as_int(p.steps_max);
        p.max_distance = parse_value_with_unit(pred.child("max_distance"), p.max_distance);
        p.time_budget_ms = pred.child("time_budget_ms").text().as_double(p.time_budget_ms);
        config.cache_ttl_ms = pred.child("cache_ttl_ms").text().as_double(config.cache_ttl_ms);
    }

    if (auto isect = root.child("intersection")) {
        auto& s = config.intersection;
        s.max_results = isect.child("max_results").text().as_int(s.max_results);
        s.time_budget_ms = isect.child("time_budget_ms").text().as_double(s.time_budget_ms);
        s.eccentricity_threshold =
            isect.child("eccentricity_threshold").text().as_double(s.eccentricity_threshold);
        s.radius_separation = parse_value_with_unit(isect.child("radius_separation"), s.radius_separation);
        s.closest_approach = isect.child("closest_approach").text().as_bool(s.closest_approach);
    }

    if (auto bodies = root.child("bodies")) {
        config.bodies_file = bodies.attribute("file").as_string();
    }

    if (auto logging = root.child("logging")) {
        if (auto level = logging.child("level")) {
            config.log_level = parse_log_level(level.text().as_string());
        }
        if (auto output = logging.child("output")) {
            config.log_output = parse_log_output(output.text().as_string());
        }
        config.log_directory = logging.child("directory").text().as_string(config.log_directory.c_str());
    }

    if (config.time_step <= 0.0 || config.time_scale < 0.0) {
        throw std::runtime_error("Invalid engine config: time_step must be positive and time_scale non-negative");
    }

    return config;
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig{};
}

bool EngineConfig::save(const std::string& path) const {
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("engine_config");

    auto sim = root.append_child("simulation");
    sim.append_child("start_epoch").text().set(start_epoch);
    auto step = sim.append_child("time_step");
    step.append_attribute("unit") = "day";
    step.text().set(time_step);
    sim.append_child("time_scale").text().set(time_scale);

    auto phys = root.append_child("physics");
    phys.append_child("soi_cooldown").text().set(physics.soi.cooldown_days);
    phys.append_child("soi_exit_hysteresis").text().set(physics.soi.exit_hysteresis);
    phys.append_child("extreme_eccentricity").text().set(physics.soi.extreme_eccentricity);
    phys.append_child("periapsis_multiplier").text().set(physics.soi.periapsis_multiplier);
    phys.append_child("min_thrust").text().set(physics.min_thrust);
    phys.append_child("sun_approach_radius").text().set(physics.sun_approach_radius);

    auto pred = root.append_child("prediction");
    pred.append_child("duration_default").text().set(prediction.duration_default);
    pred.append_child("duration_min").text().set(prediction.duration_min);
    pred.append_child("duration_max").text().set(prediction.duration_max);
    pred.append_child("steps_default").text().set(prediction.steps_default);
    pred.append_child("scale_steps").text().set(prediction.scale_steps_with_duration);
    pred.append_child("steps_per_day").text().set(prediction.steps_per_day);
    pred.append_child("steps_min").text().set(prediction.steps_min);
    pred.append_child("steps_max").text().set(prediction.steps_max);
    pred.append_child("max_distance").text().set(prediction.max_distance);
    pred.append_child("time_budget_ms").text().set(prediction.time_budget_ms);
    pred.append_child("cache_ttl_ms").text().set(cache_ttl_ms);

    auto isect = root.append_child("intersection");
    isect.append_child("max_results").text().set(intersection.max_results);
    isect.append_child("time_budget_ms").text().set(intersection.time_budget_ms);
    isect.append_child("eccentricity_threshold").text().set(intersection.eccentricity_threshold);
    isect.append_child("radius_separation").text().set(intersection.radius_separation);
    isect.append_child("closest_approach").text().set(intersection.closest_approach);

    if (!bodies_file.empty()) {
        root.append_child("bodies").append_attribute("file") = bodies_file.c_str();
    }

    auto logging = root.append_child("logging");
    logging.append_child("level").text().set(log_level_name(log_level));
    logging.append_child("output").text().set(log_output_name(log_output));
    logging.append_child("directory").text().set(log_directory.c_str());

    return doc.save_file(path.c_str());
}

// ============================================================================
// ShipConfig Implementation
// ============================================================================

ShipConfig ShipConfig::load(const std::string& path) {
    pugi::xml_document doc;
    auto root = load_root(doc, path, "ship", "ship config");

    ShipConfig config;
    config.name = root.attribute("name").as_string(config.name.c_str());
    config.mass_kg = parse_value_with_unit(root.child("mass"), config.mass_kg, "kg");

    if (auto sail = root.child("sail")) {
        config.sail.area_m2 = parse_value_with_unit(sail.child("area"), config.sail.area_m2, "m2");
        config.sail.reflectivity = sail.child("reflectivity").text().as_double(config.sail.reflectivity);
        config.sail.condition_percent =
            sail.child("condition").text().as_double(config.sail.condition_percent);
        config.sail.sail_count = sail.child("count").text().as_int(config.sail.sail_count);
    }

    if (auto prop = root.child("propulsion")) {
        config.command.deployment_percent =
            prop.child("deployment").text().as_double(config.command.deployment_percent);
        config.command.yaw = parse_value_with_unit(prop.child("yaw"), config.command.yaw, "rad");
        config.command.pitch = parse_value_with_unit(prop.child("pitch"), config.command.pitch, "rad");
    }

    if (auto orbit = root.child("orbit")) {
        config.parent = orbit.attribute("parent").as_string();
        config.a = parse_value_with_unit(orbit.child("a"), config.a, "AU");
        config.e = orbit.child("e").text().as_double(config.e);
        config.i = parse_value_with_unit(orbit.child("i"), config.i, "deg");
        config.raan = parse_value_with_unit(orbit.child("raan"), config.raan, "deg");
        config.arg_periapsis = parse_value_with_unit(orbit.child("arg_periapsis"),
                                                     config.arg_periapsis, "deg");
        config.mean_anomaly = parse_value_with_unit(orbit.child("mean_anomaly"),
                                                    config.mean_anomaly, "deg");
        config.epoch = orbit.child("epoch").text().as_double(config.epoch);
    }

    if (config.mass_kg <= 0.0) {
        throw std::runtime_error("Invalid ship config '" + config.name + "': mass must be positive");
    }

    return config;
}

orbital::ShipState ShipConfig::to_ship(const bodies::BodyCatalog& catalog, Real default_epoch) const {
    orbital::Frame frame = orbital::Frame::heliocentric();
    Real mu = MU_SUN;

    if (const bodies::Body* primary = catalog.find(catalog.primary())) {
        mu = primary->mu;
    }
    if (!parent.empty()) {
        const bodies::Body* body = catalog.find(parent);
        if (!body) {
            throw std::runtime_error("Ship '" + name + "': unknown parent body '" + parent + "'");
        }
        if (body->id != catalog.primary()) {
            if (!body->has_soi()) {
                throw std::runtime_error("Ship '" + name + "': body '" + parent +
                                         "' has no sphere of influence");
            }
            frame = orbital::Frame::in_soi(body->id);
            mu = body->mu;
        }
    }

    Real orbit_epoch = epoch > 0.0 ? epoch : default_epoch;
    auto elements = orbital::OrbitalElements::create(a, e, i, raan, arg_periapsis, mean_anomaly,
                                                     orbit_epoch, mu);

    orbital::ShipState ship(name, elements, frame);
    ship.mass_kg = mass_kg;
    ship.sail = sail;
    return ship;
}

// ============================================================================
// BodyCatalogConfig Implementation
// ============================================================================

bodies::BodyCatalog BodyCatalogConfig::load(const std::string& path) {
    pugi::xml_document doc;
    auto root = load_root(doc, path, "bodies", "body catalog");

    bodies::BodyCatalog catalog;
    for (auto node : root.children("body")) {
        bodies::Body body;
        body.name = node.attribute("name").as_string();
        body.type = parse_body_type(node.attribute("type").as_string("planet"));
        body.mu = parse_value_with_unit(node.child("mu"), 0.0, "AU3/day2");
        body.soi_radius = parse_value_with_unit(node.child("soi"), 0.0, "AU");
        // Physical radius is stored in km
        body.radius_km = parse_value_with_unit(node.child("radius"), 0.0, "km") * AU_KM;

        std::string parent_name = node.attribute("parent").as_string();
        if (!parent_name.empty()) {
            const bodies::Body* parent = catalog.find(parent_name);
            if (!parent) {
                throw std::runtime_error("Body catalog: '" + body.name + "' references unknown parent '" +
                                         parent_name + "'");
            }
            auto orbit = node.child("orbit");
            if (!orbit) {
                throw std::runtime_error("Body catalog: '" + body.name + "' has no <orbit>");
            }
            body.parent = parent->id;
            try {
                body.elements = orbital::OrbitalElements::create(
                    parse_value_with_unit(orbit.child("a"), 0.0, "AU"),
                    orbit.child("e").text().as_double(0.0),
                    parse_value_with_unit(orbit.child("i"), 0.0, "deg"),
                    parse_value_with_unit(orbit.child("raan"), 0.0, "deg"),
                    parse_value_with_unit(orbit.child("arg_periapsis"), 0.0, "deg"),
                    parse_value_with_unit(orbit.child("mean_anomaly"), 0.0, "deg"),
                    orbit.child("epoch").text().as_double(J2000),
                    parent->mu);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("Body catalog: invalid orbit for '" + body.name + "': " + e.what());
            }
        }

        try {
            catalog.add(std::move(body));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Body catalog: ") + e.what());
        }
    }

    if (catalog.empty()) {
        throw std::runtime_error("Body catalog '" + path + "' defines no bodies");
    }
    return catalog;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    search_paths_.push_back(".");
    search_paths_.push_back("./data");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

EngineConfig ConfigLoader::load_engine_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Engine config file not found: " + path);
    }
    return EngineConfig::load(resolved);
}

ShipConfig ConfigLoader::load_ship_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Ship config file not found: " + path);
    }
    return ShipConfig::load(resolved);
}

bodies::BodyCatalog ConfigLoader::load_body_catalog(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Body catalog file not found: " + path);
    }
    return BodyCatalogConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace conics::config
