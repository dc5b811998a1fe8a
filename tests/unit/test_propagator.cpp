/**
 * @file test_propagator.cpp
 * @brief Unit tests for the per-step ship propagator
 */

#include <gtest/gtest.h>
#include "conics/orbital/propagator.h"
#include "conics/core/constants.h"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace conics;
using namespace conics::constants;
using namespace conics::orbital;
using conics::bodies::Body;
using conics::bodies::BodyCatalog;

namespace {
constexpr Real T0 = J2000;
constexpr Real KMS = KMS_TO_AU_PER_DAY;
const PropulsionCommand NO_THRUST{0.0, 0.0, 0.0};
}

class PropagatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog = BodyCatalog::solar_system();
        earth = catalog.find("EARTH");
        ctx.time = T0;
        ctx.catalog = &catalog;
        ctx.soi_candidates = catalog.soi_bodies();
    }

    /// Circular heliocentric orbit well away from every planet
    ShipState circular_ship(Real a = 1.0) const {
        return ShipState("scout", OrbitalElements::create(a, 0.0, 0.0, 0.0, 0.0, 0.0, T0, MU_SUN));
    }

    /// Heliocentric ship with the given state relative to Earth
    ShipState ship_near_earth(const Vec3& offset, const Vec3& rel_velocity) const {
        StateVector body = catalog.heliocentric_state(earth->id, T0);
        auto elements = state_to_elements(body.position + offset, body.velocity + rel_velocity,
                                          MU_SUN, T0);
        return ShipState("scout", *elements);
    }

    BodyCatalog catalog;
    const Body* earth{nullptr};
    SimulationContext ctx;
    ShipPropagator propagator;
};

// ============================================================================
// Input Validation
// ============================================================================

TEST_F(PropagatorTest, RejectsInvalidStep) {
    ShipState ship = circular_ship();
    EXPECT_EQ(propagator.step(ship, ctx, 0.0, NO_THRUST).status, StepStatus::InvalidStep);
    EXPECT_EQ(propagator.step(ship, ctx, -1.0, NO_THRUST).status, StepStatus::InvalidStep);
    EXPECT_EQ(propagator.step(ship, ctx, std::numeric_limits<Real>::quiet_NaN(), NO_THRUST).status,
              StepStatus::InvalidStep);
    EXPECT_STREQ(step_status_name(StepStatus::InvalidStep), "invalid-step");
}

TEST_F(PropagatorTest, StateAtLeavesShipUntouched) {
    ShipState ship = circular_ship();
    PropagationResult quarter = propagator.state_at(ship, T0 + 365.25 / 4.0);
    ASSERT_TRUE(quarter.valid);
    EXPECT_NEAR(quarter.state.position.y, 1.0, 1e-3);
    EXPECT_DOUBLE_EQ(ship.elements.epoch(), T0);
}

TEST_F(PropagatorTest, RequiresCatalog) {
    SimulationContext empty;
    EXPECT_THROW(propagator.step(circular_ship(), empty, 1.0, NO_THRUST), std::invalid_argument);
}

TEST_F(PropagatorTest, NonFiniteElementsKeepLastState) {
    Real nan = std::numeric_limits<Real>::quiet_NaN();
    ShipState ship("broken", detail::ElementsAccess::make(1.0, 0.0, nan, 0.0, 0.0, 0.0, T0, MU_SUN));
    StepResult result = propagator.step(ship, ctx, 1.0, NO_THRUST);
    EXPECT_EQ(result.status, StepStatus::NonFiniteState);
    EXPECT_EQ(result.ship.name, "broken");
    EXPECT_DOUBLE_EQ(result.ship.elements.epoch(), T0);
    EXPECT_TRUE(result.transitions.empty());
}

// ============================================================================
// Coasting and Thrust
// ============================================================================

TEST_F(PropagatorTest, CoastMatchesKepler) {
    ShipState ship = circular_ship();
    StepResult result = propagator.step(ship, ctx, 1.0, NO_THRUST);

    ASSERT_EQ(result.status, StepStatus::Ok);
    EXPECT_FALSE(result.thrust_attempted);
    EXPECT_TRUE(result.transitions.empty());
    EXPECT_FALSE(result.collision.has_value());

    StateVector expected = elements_to_state(ship.elements, T0 + 1.0);
    EXPECT_TRUE(math::are_nearly_equal(result.helio_position, expected.position, 1e-15));
    EXPECT_DOUBLE_EQ(result.state.time, T0 + 1.0);
    EXPECT_DOUBLE_EQ(result.ship.elements.semi_major_axis(), 1.0);
}

TEST_F(PropagatorTest, OutwardSailRaisesOrbit) {
    ShipState ship = circular_ship();
    PropulsionCommand command{100.0, 0.6, 0.0};
    StepResult result = propagator.step(ship, ctx, 1.0, command);

    ASSERT_EQ(result.status, StepStatus::Ok);
    EXPECT_TRUE(result.thrust_attempted);
    EXPECT_EQ(result.thrust, ThrustStatus::Applied);
    EXPECT_GT(result.ship.elements.semi_major_axis(), 1.0);
    EXPECT_DOUBLE_EQ(result.ship.elements.epoch(), T0 + 1.0);
}

TEST_F(PropagatorTest, RetrogradeYawLowersOrbit) {
    ShipState ship = circular_ship();
    PropulsionCommand command{100.0, -0.6, 0.0};
    StepResult result = propagator.step(ship, ctx, 1.0, command);
    ASSERT_EQ(result.thrust, ThrustStatus::Applied);
    EXPECT_LT(result.ship.elements.semi_major_axis(), 1.0);
}

TEST_F(PropagatorTest, NoThrustNearTheSun) {
    ShipState ship = circular_ship(0.015);
    StepResult result = propagator.step(ship, ctx, 0.1, PropulsionCommand{});
    ASSERT_EQ(result.status, StepStatus::Ok);
    EXPECT_FALSE(result.thrust_attempted);
    EXPECT_DOUBLE_EQ(result.ship.elements.semi_major_axis(), 0.015);
}

TEST_F(PropagatorTest, InputShipUnchanged) {
    ShipState ship = circular_ship();
    propagator.step(ship, ctx, 1.0, PropulsionCommand{});
    EXPECT_DOUBLE_EQ(ship.elements.semi_major_axis(), 1.0);
    EXPECT_DOUBLE_EQ(ship.elements.epoch(), T0);
}

// ============================================================================
// SOI Handling
// ============================================================================

TEST_F(PropagatorTest, EntryDuringStep) {
    StateVector body = catalog.heliocentric_state(earth->id, T0);
    Vec3 r_hat = body.position.normalized();
    ShipState ship = ship_near_earth(r_hat * 0.105, r_hat * (-15.0 * KMS) + Vec3{0.0, 0.0, 0.5 * KMS});

    StepResult result = propagator.step(ship, ctx, 1.0, PropulsionCommand{});
    ASSERT_EQ(result.status, StepStatus::Ok);
    ASSERT_EQ(result.transitions.size(), 1u);
    EXPECT_EQ(result.transitions[0].kind, TransitionKind::Entry);
    EXPECT_EQ(result.transitions[0].body, earth->id);
    EXPECT_GT(result.transitions[0].time, T0);
    EXPECT_LT(result.transitions[0].time, T0 + 1.0);
    EXPECT_EQ(result.ship.frame, Frame::in_soi(earth->id));
    EXPECT_EQ(result.state.frame, Frame::in_soi(earth->id));

    // No thrust on a transition step
    EXPECT_FALSE(result.thrust_attempted);
}

TEST_F(PropagatorTest, ExitDuringStep) {
    Vec3 r{0.0999, 0.0, 0.0};
    Vec3 v{5.0 * KMS, 0.05 * KMS, 0.0};
    auto elements = state_to_elements(r, v, earth->mu, T0);
    ASSERT_TRUE(elements.has_value());
    ShipState ship("scout", *elements, Frame::in_soi(earth->id));

    StepResult result = propagator.step(ship, ctx, 1.0, NO_THRUST);
    ASSERT_EQ(result.status, StepStatus::Ok);
    ASSERT_EQ(result.transitions.size(), 1u);
    EXPECT_EQ(result.transitions[0].kind, TransitionKind::Exit);
    EXPECT_TRUE(result.ship.frame.is_heliocentric());
    EXPECT_DOUBLE_EQ(result.ship.elements.mu(), MU_SUN);

    // Re-entry into the same body is suppressed right after the exit
    EXPECT_TRUE(propagator.soi().in_cooldown(result.ship.soi, earth->id, T0 + 1.05));
}

TEST_F(PropagatorTest, InsideSoiWithoutExitStaysInFrame) {
    Vec3 r{0.01, 0.0, 0.0};
    Real v_circ = std::sqrt(earth->mu / 0.01);
    auto elements = state_to_elements(r, Vec3{0.0, v_circ, 0.0}, earth->mu, T0);
    ShipState ship("scout", *elements, Frame::in_soi(earth->id));

    StepResult result = propagator.step(ship, ctx, 1.0, NO_THRUST);
    ASSERT_EQ(result.status, StepStatus::Ok);
    EXPECT_TRUE(result.transitions.empty());
    EXPECT_EQ(result.ship.frame, Frame::in_soi(earth->id));
    EXPECT_NEAR(result.state.position.length(), 0.01, 1e-12);

    // Heliocentric output is body state plus relative state
    StateVector body = catalog.heliocentric_state(earth->id, T0 + 1.0);
    EXPECT_TRUE(math::are_nearly_equal(result.helio_position, body.position + result.state.position, 1e-14));
}

TEST_F(PropagatorTest, ExtremeFlybyMovesInStraightLine) {
    Vec3 r{0.05, 0.0, 0.0};
    Vec3 v{-20.0 * KMS, 5.0 * KMS, 0.0};
    ShipState ship("scout", *state_to_elements(r, v, earth->mu, T0), Frame::in_soi(earth->id));
    ship.extreme_flyby = ExtremeFlyby{r, v, T0};

    StepResult result = propagator.step(ship, ctx, 0.5, NO_THRUST);
    ASSERT_EQ(result.status, StepStatus::Ok);
    EXPECT_TRUE(math::are_nearly_equal(result.state.position, r + v * 0.5, 1e-15));
    EXPECT_FALSE(result.collision.has_value());
}

TEST_F(PropagatorTest, ToHeliocentric) {
    StateVector relative;
    relative.position = Vec3{0.01, 0.0, 0.0};
    relative.frame = Frame::in_soi(earth->id);
    relative.time = T0;

    StateVector helio = propagator.to_heliocentric(relative, catalog);
    StateVector body = catalog.heliocentric_state(earth->id, T0);
    EXPECT_TRUE(helio.frame.is_heliocentric());
    EXPECT_NEAR(helio.position.x, body.position.x + 0.01, 1e-15);

    StateVector same = propagator.to_heliocentric(helio, catalog);
    EXPECT_EQ(same.position, helio.position);
}
