/**
 * @file test_config.cpp
 * @brief Unit tests for XML configuration loading
 */

#include <gtest/gtest.h>
#include "conics/interface/config.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace conics;
using namespace conics::config;
using namespace conics::constants;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("conics_config_") + info->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string write(const std::string& filename, const std::string& content) {
        std::filesystem::path path = dir / filename;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::string create_engine_xml() {
        return R"(<?xml version="1.0" encoding="UTF-8"?>
<engine_config>
    <simulation>
        <start_epoch>2451545.0</start_epoch>
        <time_step unit="h">12</time_step>
        <time_scale>100</time_scale>
    </simulation>
    <physics>
        <soi_cooldown unit="h">4.8</soi_cooldown>
        <extreme_eccentricity>80</extreme_eccentricity>
        <sun_approach_radius unit="km">4487936.121</sun_approach_radius>
    </physics>
    <prediction>
        <duration_default unit="day">90</duration_default>
        <steps_default>400</steps_default>
        <scale_steps>true</scale_steps>
        <cache_ttl_ms>1000</cache_ttl_ms>
    </prediction>
    <intersection>
        <max_results>5</max_results>
        <closest_approach>false</closest_approach>
    </intersection>
    <bodies file="custom_bodies.xml"/>
    <logging>
        <level>debug</level>
        <output>console</output>
    </logging>
</engine_config>)";
    }

    std::string create_ship_xml() {
        return R"(<?xml version="1.0" encoding="UTF-8"?>
<ship name="Icarus">
    <mass unit="t">12</mass>
    <sail>
        <area unit="km2">2.5</area>
        <reflectivity>0.85</reflectivity>
        <condition>90</condition>
        <count>2</count>
    </sail>
    <propulsion>
        <deployment>75</deployment>
        <yaw unit="deg">30</yaw>
    </propulsion>
    <orbit>
        <a>1.2</a>
        <e>0.1</e>
        <i>5</i>
        <mean_anomaly unit="rad">1.0</mean_anomaly>
    </orbit>
</ship>)";
    }

    std::string create_bodies_xml() {
        return R"(<?xml version="1.0" encoding="UTF-8"?>
<bodies>
    <body name="STAR" type="star">
        <mu>2.9591220828559093e-4</mu>
    </body>
    <body name="WORLD" parent="STAR">
        <mu unit="km3/s2">398600.4418</mu>
        <soi>0.01</soi>
        <radius>6371</radius>
        <orbit>
            <a>1.5</a>
            <e>0.05</e>
            <i>2</i>
        </orbit>
    </body>
    <body name="ROCK" type="moon" parent="WORLD">
        <radius>1000</radius>
        <orbit>
            <a unit="km">200000</a>
        </orbit>
    </body>
</bodies>)";
    }

    std::filesystem::path dir;
};

// ============================================================================
// Unit Conversion Tests
// ============================================================================

TEST(UnitConversionTest, EngineUnits) {
    EXPECT_DOUBLE_EQ(convert_to_engine_units(AU_KM, "km"), 1.0);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(AU_M, "m"), 1.0);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(180.0, "deg"), PI);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(36.0, "h"), 1.5);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(SECONDS_PER_DAY, "s"), 1.0);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(3.0, "km2"), 3.0e6);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(2.0, "t"), 2000.0);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(1.0, "km/s"), KMS_TO_AU_PER_DAY);
    EXPECT_NEAR(convert_to_engine_units(1.32712440018e11, "km3/s2"), MU_SUN, 1e-12);

    // Unknown units pass through
    EXPECT_DOUBLE_EQ(convert_to_engine_units(4.2, "furlong"), 4.2);
    EXPECT_DOUBLE_EQ(convert_to_engine_units(4.2, ""), 4.2);
}

// ============================================================================
// Engine Config Tests
// ============================================================================

TEST_F(ConfigTest, EngineDefaults) {
    EngineConfig config = EngineConfig::defaults();
    EXPECT_DOUBLE_EQ(config.start_epoch, DEFAULT_START_EPOCH);
    EXPECT_DOUBLE_EQ(config.time_step, 1.0);
    EXPECT_DOUBLE_EQ(config.cache_ttl_ms, CACHE_TTL_MS);
    EXPECT_DOUBLE_EQ(config.physics.soi.extreme_eccentricity, EXTREME_ECCENTRICITY);
    EXPECT_EQ(config.prediction.steps_default, PREDICTION_STEPS_DEFAULT);
    EXPECT_TRUE(config.bodies_file.empty());
}

TEST_F(ConfigTest, LoadEngineConfig) {
    EngineConfig config = EngineConfig::load(write("engine.xml", create_engine_xml()));

    EXPECT_DOUBLE_EQ(config.start_epoch, J2000);
    EXPECT_DOUBLE_EQ(config.time_step, 0.5);
    EXPECT_DOUBLE_EQ(config.time_scale, 100.0);
    EXPECT_DOUBLE_EQ(config.physics.soi.cooldown_days, 0.2);
    EXPECT_DOUBLE_EQ(config.physics.soi.extreme_eccentricity, 80.0);
    EXPECT_NEAR(config.physics.sun_approach_radius, 0.03, 1e-9);
    // Unspecified values keep their defaults
    EXPECT_DOUBLE_EQ(config.physics.soi.exit_hysteresis, SOI_EXIT_HYSTERESIS);

    EXPECT_DOUBLE_EQ(config.prediction.duration_default, 90.0);
    EXPECT_EQ(config.prediction.steps_default, 400);
    EXPECT_TRUE(config.prediction.scale_steps_with_duration);
    EXPECT_DOUBLE_EQ(config.cache_ttl_ms, 1000.0);

    EXPECT_EQ(config.intersection.max_results, 5);
    EXPECT_FALSE(config.intersection.closest_approach);
    EXPECT_EQ(config.bodies_file, "custom_bodies.xml");
    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.log_output, LogOutput::Console);
}

TEST_F(ConfigTest, SaveAndReload) {
    EngineConfig config = EngineConfig::defaults();
    config.time_step = 2.0;
    config.prediction.steps_max = 1500;
    config.intersection.radius_separation = 0.02;
    config.bodies_file = "bodies.xml";
    config.log_level = LogLevel::Warn;

    std::string path = (dir / "saved.xml").string();
    ASSERT_TRUE(config.save(path));

    EngineConfig reloaded = EngineConfig::load(path);
    EXPECT_DOUBLE_EQ(reloaded.time_step, 2.0);
    EXPECT_EQ(reloaded.prediction.steps_max, 1500);
    EXPECT_DOUBLE_EQ(reloaded.intersection.radius_separation, 0.02);
    EXPECT_EQ(reloaded.bodies_file, "bodies.xml");
    EXPECT_EQ(reloaded.log_level, LogLevel::Warn);
}

TEST_F(ConfigTest, EngineConfigErrors) {
    EXPECT_THROW(EngineConfig::load((dir / "missing.xml").string()), std::runtime_error);
    EXPECT_THROW(EngineConfig::load(write("bad.xml", "<engine_config><simulation>")), std::runtime_error);
    EXPECT_THROW(EngineConfig::load(write("wrong_root.xml", "<ship/>")), std::runtime_error);
    EXPECT_THROW(EngineConfig::load(write("negative.xml",
        "<engine_config><simulation><time_step>-1</time_step></simulation></engine_config>")),
        std::runtime_error);
}

// ============================================================================
// Ship Config Tests
// ============================================================================

TEST_F(ConfigTest, LoadShipConfig) {
    ShipConfig ship = ShipConfig::load(write("ship.xml", create_ship_xml()));

    EXPECT_EQ(ship.name, "Icarus");
    EXPECT_DOUBLE_EQ(ship.mass_kg, 12000.0);
    EXPECT_DOUBLE_EQ(ship.sail.area_m2, 2.5e6);
    EXPECT_DOUBLE_EQ(ship.sail.reflectivity, 0.85);
    EXPECT_DOUBLE_EQ(ship.sail.condition_percent, 90.0);
    EXPECT_EQ(ship.sail.sail_count, 2);
    EXPECT_DOUBLE_EQ(ship.command.deployment_percent, 75.0);
    EXPECT_NEAR(ship.command.yaw, 30.0 * DEG_TO_RAD, 1e-15);
    EXPECT_DOUBLE_EQ(ship.command.pitch, 0.0);

    EXPECT_TRUE(ship.parent.empty());
    EXPECT_DOUBLE_EQ(ship.a, 1.2);
    EXPECT_DOUBLE_EQ(ship.e, 0.1);
    EXPECT_NEAR(ship.i, 5.0 * DEG_TO_RAD, 1e-15);
    EXPECT_DOUBLE_EQ(ship.mean_anomaly, 1.0);
    EXPECT_DOUBLE_EQ(ship.epoch, 0.0);
}

TEST_F(ConfigTest, ShipToState) {
    ShipConfig config = ShipConfig::load(write("ship.xml", create_ship_xml()));
    bodies::BodyCatalog catalog = bodies::BodyCatalog::solar_system();

    orbital::ShipState ship = config.to_ship(catalog, J2000);
    EXPECT_EQ(ship.name, "Icarus");
    EXPECT_TRUE(ship.frame.is_heliocentric());
    EXPECT_DOUBLE_EQ(ship.elements.mu(), MU_SUN);
    EXPECT_DOUBLE_EQ(ship.elements.epoch(), J2000);
    EXPECT_DOUBLE_EQ(ship.mass_kg, 12000.0);
    EXPECT_EQ(ship.sail.sail_count, 2);

    config.parent = "EARTH";
    config.a = 0.001;
    orbital::ShipState orbiter = config.to_ship(catalog, J2000);
    const bodies::Body* earth = catalog.find("EARTH");
    EXPECT_EQ(orbiter.frame, orbital::Frame::in_soi(earth->id));
    EXPECT_DOUBLE_EQ(orbiter.elements.mu(), earth->mu);

    config.parent = "LUNA";
    EXPECT_THROW(config.to_ship(catalog, J2000), std::runtime_error);
    config.parent = "VULCAN";
    EXPECT_THROW(config.to_ship(catalog, J2000), std::runtime_error);

    config.parent.clear();
    config.a = -1.0;
    EXPECT_THROW(config.to_ship(catalog, J2000), std::invalid_argument);
}

TEST_F(ConfigTest, ShipMassMustBePositive) {
    EXPECT_THROW(ShipConfig::load(write("massless.xml", "<ship name=\"x\"><mass>0</mass></ship>")),
                 std::runtime_error);
}

// ============================================================================
// Body Catalog Tests
// ============================================================================

TEST_F(ConfigTest, LoadBodyCatalog) {
    bodies::BodyCatalog catalog = BodyCatalogConfig::load(write("bodies.xml", create_bodies_xml()));

    ASSERT_EQ(catalog.size(), 3u);
    EXPECT_EQ(catalog.get(catalog.primary()).name, "STAR");

    const bodies::Body* world = catalog.find("WORLD");
    ASSERT_NE(world, nullptr);
    EXPECT_EQ(world->parent, catalog.primary());
    EXPECT_TRUE(world->has_soi());
    EXPECT_NEAR(world->mu, convert_to_engine_units(398600.4418, "km3/s2"), 1e-20);
    EXPECT_NEAR(world->radius_km, 6371.0, 1e-6);
    ASSERT_TRUE(world->elements.has_value());
    EXPECT_DOUBLE_EQ(world->elements->semi_major_axis(), 1.5);
    EXPECT_NEAR(world->elements->inclination(), 2.0 * DEG_TO_RAD, 1e-15);
    EXPECT_DOUBLE_EQ(world->elements->mu(), MU_SUN);

    const bodies::Body* rock = catalog.find("ROCK");
    ASSERT_NE(rock, nullptr);
    EXPECT_EQ(rock->type, bodies::BodyType::Moon);
    EXPECT_EQ(rock->parent, world->id);
    EXPECT_NEAR(rock->elements->semi_major_axis(), 200000.0 / AU_KM, 1e-15);
    EXPECT_DOUBLE_EQ(rock->elements->mu(), world->mu);
    EXPECT_FALSE(rock->has_soi());
}

TEST_F(ConfigTest, BodyCatalogErrors) {
    EXPECT_THROW(BodyCatalogConfig::load(write("empty.xml", "<bodies/>")), std::runtime_error);
    EXPECT_THROW(BodyCatalogConfig::load(write("orphan.xml",
        "<bodies><body name=\"A\" parent=\"NOWHERE\"><orbit><a>1</a></orbit></body></bodies>")),
        std::runtime_error);
    EXPECT_THROW(BodyCatalogConfig::load(write("no_orbit.xml",
        "<bodies><body name=\"S\"><mu>1e-4</mu></body><body name=\"P\" parent=\"S\"/></bodies>")),
        std::runtime_error);
    EXPECT_THROW(BodyCatalogConfig::load(write("bad_orbit.xml",
        "<bodies><body name=\"S\"><mu>1e-4</mu></body>"
        "<body name=\"P\" parent=\"S\"><orbit><a>-1</a><e>0.5</e></orbit></body></bodies>")),
        std::runtime_error);
    EXPECT_THROW(BodyCatalogConfig::load(write("duplicate.xml",
        "<bodies><body name=\"S\"/><body name=\"S\"/></bodies>")),
        std::runtime_error);
}

// ============================================================================
// Config Loader Tests
// ============================================================================

TEST_F(ConfigTest, LoaderSearchPaths) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.search_paths().empty());
    EXPECT_TRUE(loader.find_file("conics_no_such_file.xml").empty());

    write("engine.xml", create_engine_xml());
    loader.add_search_path(dir.string());
    std::string resolved = loader.find_file("engine.xml");
    EXPECT_FALSE(resolved.empty());
    EXPECT_EQ(loader.load_engine_config("engine.xml").time_scale, 100.0);

    write("ship.xml", create_ship_xml());
    EXPECT_EQ(loader.load_ship_config("ship.xml").name, "Icarus");

    write("bodies.xml", create_bodies_xml());
    EXPECT_EQ(loader.load_body_catalog("bodies.xml").size(), 3u);

    EXPECT_THROW(loader.load_engine_config("conics_no_such_file.xml"), std::runtime_error);
}
