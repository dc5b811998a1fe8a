/**
 * @file test_engine.cpp
 * @brief Unit tests for the engine facade
 */

#include <gtest/gtest.h>
#include "conics/interface/api.h"
#include "conics/orbital/conversion.h"
#include "conics/core/constants.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace conics;
using namespace conics::constants;
using namespace conics::orbital;
using namespace conics::events;

namespace {
constexpr Real KMS = KMS_TO_AU_PER_DAY;
}

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config::EngineConfig cfg = config::EngineConfig::defaults();
        cfg.start_epoch = J2000;
        cfg.log_level = LogLevel::Off;
        ASSERT_TRUE(engine.initialize(cfg));

        engine.get_event_dispatcher().subscribe_all([this](Event& e) {
            received.push_back(e.type());
            return true;
        });
    }

    void TearDown() override {
        engine.shutdown();
    }

    ShipState circular_ship(Real a = 1.0) const {
        return ShipState("scout", OrbitalElements::create(a, 0.0, 0.0, 0.0, 0.0, 0.0, J2000, MU_SUN));
    }

    SizeT count(EventType type) const {
        SizeT n = 0;
        for (EventType t : received) {
            if (t == type) {
                n++;
            }
        }
        return n;
    }

    Engine engine;
    std::vector<EventType> received;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST(EngineLifecycleTest, RequiresInitialization) {
    Engine engine;
    EXPECT_FALSE(engine.is_initialized());
    EXPECT_EQ(engine.get_state(), SimulationState::Uninitialized);
    EXPECT_EQ(engine.advance(1.0), AdvanceResult::NotInitialized);
    EXPECT_STREQ(advance_result_name(AdvanceResult::NotInitialized), "not-initialized");
}

TEST(EngineLifecycleTest, MissingConfigFallsBackToDefaults) {
    Engine engine;
    EXPECT_TRUE(engine.initialize("conics_no_such_config.xml"));
    EXPECT_DOUBLE_EQ(engine.get_time(), DEFAULT_START_EPOCH);
    EXPECT_EQ(engine.get_bodies().get(engine.get_bodies().primary()).name, "SOL");
    EXPECT_EQ(engine.get_soi_candidates().size(), 5u);
    engine.shutdown();
    EXPECT_FALSE(engine.is_initialized());
}

TEST_F(EngineTest, FirstAdvanceStartsSimulation) {
    EXPECT_EQ(engine.get_state(), SimulationState::Initialized);
    EXPECT_EQ(engine.advance(0.5), AdvanceResult::Ok);
    EXPECT_EQ(engine.get_state(), SimulationState::Running);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000 + 0.5);
    EXPECT_EQ(count(EventType::SimulationStarted), 1u);
    EXPECT_EQ(count(EventType::TimeStepCompleted), 1u);
}

TEST_F(EngineTest, RejectsInvalidStep) {
    EXPECT_EQ(engine.advance(0.0), AdvanceResult::InvalidStep);
    EXPECT_EQ(engine.advance(-1.0), AdvanceResult::InvalidStep);
    EXPECT_EQ(engine.advance(std::numeric_limits<Real>::infinity()), AdvanceResult::InvalidStep);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000);
}

TEST_F(EngineTest, PauseResumeStop) {
    engine.start();
    engine.pause();
    EXPECT_EQ(engine.get_state(), SimulationState::Paused);
    EXPECT_EQ(engine.advance(1.0), AdvanceResult::Paused);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000);

    engine.resume();
    EXPECT_EQ(engine.advance(1.0), AdvanceResult::Ok);

    engine.stop();
    EXPECT_EQ(engine.get_state(), SimulationState::Stopped);
    EXPECT_EQ(engine.advance(1.0), AdvanceResult::Paused);

    EXPECT_EQ(count(EventType::SimulationPaused), 1u);
    EXPECT_EQ(count(EventType::SimulationResumed), 1u);
    EXPECT_EQ(count(EventType::SimulationStopped), 1u);
}

TEST_F(EngineTest, ZeroTimeScaleAdvancesNothing) {
    engine.set_time_scale(0.0);
    EXPECT_EQ(engine.advance(1.0), AdvanceResult::Paused);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000);
}

TEST_F(EngineTest, ScaledStepIsClamped) {
    engine.get_event_dispatcher().subscribe(EventType::TimeStepCompleted, [](Event& e) {
        const auto& data = e.get_data<StepEventData>();
        EXPECT_DOUBLE_EQ(data.requested_dt, 0.5);
        EXPECT_DOUBLE_EQ(data.simulated_dt, 1.0);
        return true;
    });
    engine.set_time_scale(10.0);
    EXPECT_EQ(engine.advance(0.5), AdvanceResult::Ok);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000 + 1.0);
}

TEST_F(EngineTest, ReentrantAdvanceRejected) {
    std::vector<AdvanceResult> nested;
    engine.get_event_dispatcher().subscribe(EventType::TimeStepCompleted, [&](Event&) {
        nested.push_back(engine.advance(1.0));
        return true;
    });

    EXPECT_EQ(engine.advance(1.0), AdvanceResult::Ok);
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0], AdvanceResult::Reentrant);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000 + 1.0);
    EXPECT_EQ(count(EventType::AdvanceRejected), 1u);
}

// ============================================================================
// Ships
// ============================================================================

TEST_F(EngineTest, AddAndRemoveShips) {
    ShipId first = engine.add_ship(circular_ship());
    ShipId second = engine.add_ship(circular_ship(1.5));
    EXPECT_NE(first, second);
    EXPECT_TRUE(engine.ship_exists(first));
    EXPECT_EQ(engine.get_ship_ids().size(), 2u);
    EXPECT_EQ(engine.get_ship(second).name, "scout");

    EXPECT_TRUE(engine.remove_ship(first));
    EXPECT_FALSE(engine.remove_ship(first));
    EXPECT_THROW(engine.get_ship(first), std::out_of_range);

    ShipState lost = circular_ship();
    lost.frame = Frame::in_soi(999);
    EXPECT_THROW(engine.add_ship(lost), std::invalid_argument);

    EXPECT_EQ(engine.add_ship(std::string("conics_no_such_ship.xml")), INVALID_SHIP_ID);
}

TEST_F(EngineTest, ShipsCoastByDefault) {
    ShipId id = engine.add_ship(circular_ship());
    PropulsionCommand command = engine.get_propulsion(id);
    EXPECT_DOUBLE_EQ(command.deployment_percent, 0.0);

    ASSERT_EQ(engine.advance(1.0), AdvanceResult::Ok);
    StateVector expected = elements_to_state(circular_ship().elements, J2000 + 1.0);
    StateVector state = engine.get_ship_state(id);
    EXPECT_TRUE(math::are_nearly_equal(state.position, expected.position, 1e-14));
    EXPECT_DOUBLE_EQ(engine.get_ship(id).elements.semi_major_axis(), 1.0);

    StateVector helio = engine.get_ship_heliocentric_state(id);
    EXPECT_EQ(helio.position, state.position);
}

TEST_F(EngineTest, PropulsionRaisesOrbit) {
    ShipId id = engine.add_ship(circular_ship());
    engine.set_propulsion(id, PropulsionCommand{100.0, 0.6, 0.0});
    ASSERT_EQ(engine.advance(1.0), AdvanceResult::Ok);
    EXPECT_GT(engine.get_ship(id).elements.semi_major_axis(), 1.0);
}

TEST_F(EngineTest, NonFiniteShipKeepsLastState) {
    Real nan = std::numeric_limits<Real>::quiet_NaN();
    ShipId broken = engine.add_ship(ShipState("broken",
        detail::ElementsAccess::make(nan, 0.0, 0.0, 0.0, 0.0, 0.0, J2000, MU_SUN)));
    ShipId healthy = engine.add_ship(circular_ship());

    EXPECT_EQ(engine.advance(1.0), AdvanceResult::NonFiniteState);
    EXPECT_DOUBLE_EQ(engine.get_time(), J2000 + 1.0);
    EXPECT_DOUBLE_EQ(engine.get_ship(broken).elements.epoch(), J2000);
    EXPECT_TRUE(engine.get_ship_state(healthy).is_finite());
    EXPECT_EQ(count(EventType::NonFiniteState), 1u);
}

TEST_F(EngineTest, SoiEntryRaisesEvent) {
    const bodies::Body* earth = engine.get_bodies().find("EARTH");
    ASSERT_NE(earth, nullptr);
    StateVector body = engine.get_bodies().heliocentric_state(earth->id, J2000);
    Vec3 r_hat = body.position.normalized();
    auto elements = state_to_elements(body.position + r_hat * 0.105,
                                      body.velocity + r_hat * (-15.0 * KMS) + Vec3{0.0, 0.0, 0.5 * KMS},
                                      MU_SUN, J2000);
    ASSERT_TRUE(elements.has_value());
    ShipId id = engine.add_ship(ShipState("scout", *elements));

    std::string entered;
    engine.get_event_dispatcher().subscribe(EventType::SoiEntry, [&](Event& e) {
        entered = e.get_data<SoiEventData>().body_name;
        EXPECT_EQ(e.source(), id);
        return true;
    });

    ASSERT_EQ(engine.advance(1.0), AdvanceResult::Ok);
    EXPECT_EQ(entered, "EARTH");
    EXPECT_EQ(engine.get_ship(id).frame, Frame::in_soi(earth->id));
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(EngineTest, PredictionIsCachedPerShip) {
    ShipId id = engine.add_ship(circular_ship());
    auto first = engine.predict_trajectory(id);
    auto second = engine.predict_trajectory(id);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_DOUBLE_EQ(first->start_time, J2000);

    engine.invalidate_caches();
    auto third = engine.predict_trajectory(id);
    EXPECT_NE(first.get(), third.get());
    EXPECT_EQ(first->hash, third->hash);

    // Planning from another time is a different request
    auto planned = engine.predict_trajectory(id, 0.0, J2000 + 10.0);
    EXPECT_NE(planned->hash, third->hash);

    EXPECT_THROW(engine.predict_trajectory(12345), std::out_of_range);
}

TEST_F(EngineTest, IntersectionsFollowTrajectory) {
    // Outward spiral from 0.9 AU toward Earth's orbit
    ShipId id = engine.add_ship(circular_ship(0.9));
    engine.set_propulsion(id, PropulsionCommand{100.0, 0.6, 0.0});

    auto trajectory = engine.predict_trajectory(id, 60.0);
    auto report = engine.detect_intersections(id, 60.0);
    ASSERT_NE(report, nullptr);
    EXPECT_EQ(report->trajectory_hash, trajectory->hash);

    auto again = engine.detect_intersections(id, 60.0);
    EXPECT_EQ(report.get(), again.get());
}

TEST_F(EngineTest, GravityAssistPassthrough) {
    const bodies::Body* earth = engine.get_bodies().find("EARTH");
    auto elements = OrbitalElements::create(-0.001, 2.0, 0.0, 0.0, 0.0, 0.0, J2000, earth->mu);
    StateVector entry = elements_to_state(elements, J2000 - 2.0, Frame::in_soi(earth->id));
    StateVector exit = elements_to_state(elements, J2000 + 2.0, Frame::in_soi(earth->id));

    GravityAssistResult result = engine.analyze_gravity_assist(entry, exit, earth->mu);
    EXPECT_TRUE(result.ok());
    EXPECT_NEAR(result.eccentricity, 2.0, 1e-9);
    EXPECT_FALSE(engine.get_last_flyby(engine.add_ship(circular_ship())).has_value());
}
