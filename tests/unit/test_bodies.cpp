/**
 * @file test_bodies.cpp
 * @brief Unit tests for the body catalog and ephemeris sources
 */

#include <gtest/gtest.h>
#include "conics/bodies/body.h"
#include "conics/core/constants.h"
#include <cmath>
#include <memory>
#include <stdexcept>

using namespace conics;
using namespace conics::constants;
using namespace conics::bodies;
using conics::orbital::OrbitalElements;

// ============================================================================
// Solar System Tests
// ============================================================================

class SolarSystemTest : public ::testing::Test {
protected:
    BodyCatalog catalog = BodyCatalog::solar_system();
};

TEST_F(SolarSystemTest, PrimaryIsTheSun) {
    BodyId sun = catalog.primary();
    ASSERT_NE(sun, INVALID_BODY_ID);
    EXPECT_EQ(catalog.get(sun).name, "SOL");
    EXPECT_EQ(catalog.get(sun).type, BodyType::Star);
    EXPECT_DOUBLE_EQ(catalog.get(sun).mu, MU_SUN);
    EXPECT_FALSE(catalog.get(sun).elements.has_value());
}

TEST_F(SolarSystemTest, LookupByName) {
    const Body* earth = catalog.find("EARTH");
    ASSERT_NE(earth, nullptr);
    EXPECT_EQ(earth->parent, catalog.primary());
    EXPECT_TRUE(earth->has_soi());
    EXPECT_NEAR(earth->radius_au() * AU_KM, 6371.0, 1e-9);
    EXPECT_EQ(catalog.find(earth->id), earth);
    EXPECT_EQ(catalog.find("VULCAN"), nullptr);
}

TEST_F(SolarSystemTest, MoonsOrbitTheirPlanets) {
    const Body* luna = catalog.find("LUNA");
    const Body* earth = catalog.find("EARTH");
    ASSERT_NE(luna, nullptr);
    EXPECT_EQ(luna->parent, earth->id);
    EXPECT_EQ(luna->type, BodyType::Moon);
    EXPECT_FALSE(luna->has_soi());

    // Luna stays within ~0.003 AU of Earth
    Real t = J2000 + 100.0;
    Real separation = math::distance(catalog.heliocentric_state(luna->id, t).position,
                                     catalog.heliocentric_state(earth->id, t).position);
    EXPECT_LT(separation, 0.003);
    EXPECT_GT(separation, 0.002);
}

TEST_F(SolarSystemTest, SoiBodiesAreInnerPlanetsAndJupiter) {
    std::vector<BodyId> ids = catalog.soi_bodies();
    ASSERT_EQ(ids.size(), 5u);
    EXPECT_EQ(catalog.get(ids[0]).name, "MERCURY");
    EXPECT_EQ(catalog.get(ids[2]).name, "EARTH");
    EXPECT_EQ(catalog.get(ids[4]).name, "JUPITER");
    EXPECT_DOUBLE_EQ(catalog.get(ids[4]).soi_radius, 0.4);
}

TEST_F(SolarSystemTest, EarthHeliocentricState) {
    const Body* earth = catalog.find("EARTH");
    orbital::StateVector state = catalog.heliocentric_state(earth->id, J2000);
    EXPECT_TRUE(state.frame.is_heliocentric());
    EXPECT_NEAR(state.position.length(), 0.983, 0.002);     // near perihelion in January
    EXPECT_NEAR(state.velocity.length() / KMS_TO_AU_PER_DAY, 30.3, 0.2);
    EXPECT_DOUBLE_EQ(state.time, J2000);
}

TEST_F(SolarSystemTest, UnknownIdThrows) {
    EXPECT_THROW(catalog.get(9999), std::out_of_range);
    EXPECT_EQ(catalog.find(BodyId{9999}), nullptr);
}

// ============================================================================
// BodyCatalog Construction Tests
// ============================================================================

TEST(BodyCatalogTest, AddValidates) {
    BodyCatalog catalog;
    EXPECT_TRUE(catalog.empty());
    EXPECT_EQ(catalog.primary(), INVALID_BODY_ID);

    Body star;
    star.name = "STAR";
    star.type = BodyType::Star;
    star.mu = MU_SUN;
    BodyId star_id = catalog.add(star);
    EXPECT_EQ(star_id, 0u);
    EXPECT_EQ(catalog.primary(), star_id);

    // Duplicate and empty names
    EXPECT_THROW(catalog.add(star), std::invalid_argument);
    Body unnamed;
    EXPECT_THROW(catalog.add(unnamed), std::invalid_argument);

    // Parent without elements, unknown parent
    Body orphan;
    orphan.name = "ORPHAN";
    orphan.parent = star_id;
    EXPECT_THROW(catalog.add(orphan), std::invalid_argument);
    orphan.parent = 42;
    orphan.elements = OrbitalElements::create(1.0, 0.0, 0.0, 0.0, 0.0, 0.0, J2000, MU_SUN);
    EXPECT_THROW(catalog.add(orphan), std::invalid_argument);

    orphan.parent = star_id;
    EXPECT_EQ(catalog.add(orphan), 1u);
    EXPECT_EQ(catalog.size(), 2u);
}

TEST(BodyCatalogTest, SoiRequiresMassAndRadius) {
    Body body;
    body.mu = 1e-9;
    EXPECT_FALSE(body.has_soi());
    body.soi_radius = 0.1;
    EXPECT_TRUE(body.has_soi());
    body.mu = 0.0;
    EXPECT_FALSE(body.has_soi());
}

// ============================================================================
// Ephemeris Tests
// ============================================================================

TEST(TabulatedEphemerisTest, ExactAndInterpolatedSamples) {
    TabulatedEphemeris ephemeris;
    Vec3 velocity{0.0, 0.1, 0.0};
    ephemeris.add_sample("EARTH", 0.0, Vec3{1.0, 0.0, 0.0}, velocity);
    ephemeris.add_sample("EARTH", 10.0, Vec3{1.0, 1.0, 0.0}, velocity);
    EXPECT_EQ(ephemeris.sample_count("EARTH"), 2u);

    Body earth;
    earth.name = "EARTH";

    auto exact = ephemeris.heliocentric_state(earth, 10.0);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->position, (Vec3{1.0, 1.0, 0.0}));

    // Linear motion is reproduced by the Hermite interpolant
    auto mid = ephemeris.heliocentric_state(earth, 5.0);
    ASSERT_TRUE(mid.has_value());
    EXPECT_NEAR(mid->position.y, 0.5, 1e-12);
    EXPECT_NEAR(mid->velocity.y, 0.1, 1e-12);

    EXPECT_FALSE(ephemeris.heliocentric_state(earth, 11.0).has_value());
    Body mars;
    mars.name = "MARS";
    EXPECT_FALSE(ephemeris.heliocentric_state(mars, 5.0).has_value());
}

TEST(TabulatedEphemerisTest, CatalogPrefersEphemerisInsideItsRange) {
    BodyCatalog catalog = BodyCatalog::solar_system();
    const Body* earth = catalog.find("EARTH");

    auto ephemeris = std::make_shared<TabulatedEphemeris>();
    ephemeris->add_sample("EARTH", J2000, Vec3{0.5, 0.0, 0.0}, Vec3::Zero());
    ephemeris->add_sample("EARTH", J2000 + 1.0, Vec3{0.5, 0.0, 0.0}, Vec3::Zero());
    catalog.set_ephemeris(ephemeris);

    EXPECT_NEAR(catalog.heliocentric_state(earth->id, J2000 + 0.5).position.x, 0.5, 1e-12);

    // Outside the table the analytic orbit is used
    EXPECT_NEAR(catalog.heliocentric_state(earth->id, J2000 + 2.0).position.length(), 0.983, 0.002);
}
