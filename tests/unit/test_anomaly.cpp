/**
 * @file test_anomaly.cpp
 * @brief Unit tests for Kepler equation solvers and anomaly conversions
 */

#include <gtest/gtest.h>
#include "conics/orbital/anomaly.h"
#include "conics/core/constants.h"
#include <cmath>

using namespace conics;
using namespace conics::constants;
using namespace conics::orbital::anomaly;

// ============================================================================
// Elliptic Solver Tests
// ============================================================================

TEST(EllipticSolverTest, CircularReturnsMeanAnomaly) {
    SolverResult result = solve_elliptic(1.3, 0.0);
    EXPECT_TRUE(result.converged);
    EXPECT_DOUBLE_EQ(result.anomaly, 1.3);
    EXPECT_EQ(result.iterations, 0);
}

TEST(EllipticSolverTest, SatisfiesKeplerEquation) {
    for (Real e : {0.01, 0.3, 0.7, 0.85, 0.95, 0.99}) {
        for (Real M : {0.1, 1.0, 2.5, PI, 4.0, 6.0}) {
            SolverResult result = solve_elliptic(M, e);
            EXPECT_TRUE(result.converged) << "e=" << e << " M=" << M;
            Real residual = result.anomaly - e * std::sin(result.anomaly) - M;
            EXPECT_NEAR(residual, 0.0, 1e-10) << "e=" << e << " M=" << M;
        }
    }
}

TEST(EllipticSolverTest, KnownValue) {
    // Vallado example 2-1: M = 235.4 deg, e = 0.4 gives E = 220.512074767 deg
    SolverResult result = solve_elliptic(235.4 * DEG_TO_RAD, 0.4);
    EXPECT_NEAR(result.anomaly * RAD_TO_DEG, 220.512074767, 1e-6);
}

// ============================================================================
// Hyperbolic Solver Tests
// ============================================================================

TEST(HyperbolicSolverTest, SatisfiesKeplerEquation) {
    for (Real e : {1.01, 1.5, 3.0, 10.0, 60.0}) {
        for (Real M : {-20.0, -1.0, 0.0, 0.5, 5.0, 100.0}) {
            SolverResult result = solve_hyperbolic(M, e);
            EXPECT_TRUE(result.converged) << "e=" << e << " M=" << M;
            Real residual = hyperbolic_to_mean(result.anomaly, e) - M;
            EXPECT_NEAR(residual, 0.0, 1e-8 * std::max(1.0, std::abs(M))) << "e=" << e << " M=" << M;
        }
    }
}

TEST(HyperbolicSolverTest, ExtremeMeanAnomalyStaysFinite) {
    SolverResult result = solve_hyperbolic(1e30, 1.5);
    EXPECT_TRUE(std::isfinite(result.anomaly));
    EXPECT_LE(std::abs(result.anomaly), MAX_HYPERBOLIC_ANOMALY);
}

// ============================================================================
// Conversion Tests
// ============================================================================

TEST(AnomalyConversionTest, EccentricTrueRoundTrip) {
    for (Real e : {0.0, 0.1, 0.5, 0.9}) {
        for (Real nu : {0.0, 0.5, 2.0, 3.5, 5.9}) {
            Real E = true_to_eccentric(nu, e);
            EXPECT_NEAR(eccentric_to_true(E, e), nu, 1e-10) << "e=" << e << " nu=" << nu;
        }
    }
}

TEST(AnomalyConversionTest, EccentricToTrueRange) {
    Real nu = eccentric_to_true(-0.5, 0.3);
    EXPECT_GE(nu, 0.0);
    EXPECT_LT(nu, TWO_PI);
}

TEST(AnomalyConversionTest, HyperbolicTrueRoundTrip) {
    Real e = 2.0;
    for (Real nu : {-1.5, -0.5, 0.0, 0.7, 1.8}) {
        Conversion H = true_to_hyperbolic(nu, e);
        EXPECT_FALSE(H.clamped);
        Conversion back = hyperbolic_to_true(H.anomaly, e);
        EXPECT_FALSE(back.clamped);
        EXPECT_NEAR(back.anomaly, nu, 1e-10);
    }
}

TEST(AnomalyConversionTest, HyperbolicTrueAnomalyBounded) {
    Real e = 1.5;
    Real limit = hyperbolic_true_anomaly_limit(e);
    EXPECT_NEAR(limit, std::acos(-1.0 / e), 1e-15);

    Conversion nu = hyperbolic_to_true(40.0, e);
    EXPECT_TRUE(nu.clamped);
    EXPECT_LT(std::abs(nu.anomaly), limit);
}

TEST(AnomalyConversionTest, AsymptoticTrueAnomalyClamped) {
    Real e = 1.5;
    Real limit = hyperbolic_true_anomaly_limit(e);
    Conversion H = true_to_hyperbolic(limit, e);
    EXPECT_TRUE(H.clamped);
    EXPECT_TRUE(std::isfinite(H.anomaly));
    EXPECT_GT(H.anomaly, 0.0);
}

// ============================================================================
// Mean Anomaly Tests
// ============================================================================

TEST(MeanAnomalyTest, MeanMotion) {
    // 1 AU around the Sun: about 0.0172 rad/day
    EXPECT_NEAR(mean_motion(1.0, MU_SUN), std::sqrt(MU_SUN), 1e-15);
    EXPECT_NEAR(mean_motion(-2.0, MU_SUN), std::sqrt(MU_SUN / 8.0), 1e-15);
}

TEST(MeanAnomalyTest, WrapsOnlyWhenBound) {
    Real wrapped = propagate_mean_anomaly(6.0, 1.0, 1.0, false);
    EXPECT_NEAR(wrapped, 7.0 - TWO_PI, 1e-12);

    Real unwrapped = propagate_mean_anomaly(6.0, 1.0, 1.0, true);
    EXPECT_DOUBLE_EQ(unwrapped, 7.0);
}
