#pragma once
/**
 * @file anomaly.h
 * @brief Kepler equation solvers and anomaly conversions
 *
 * Stateless numerical routines. Solvers never throw: a non-converged solve
 * returns the best estimate with converged == false.
 */

#include "conics/core/types.h"

namespace conics::orbital::anomaly {

/**
 * @brief Newton-Raphson solve result
 */
struct SolverResult {
    Real anomaly{0.0};      ///< Eccentric (E) or hyperbolic (H) anomaly
    int iterations{0};
    bool converged{true};
};

/**
 * @brief Anomaly conversion result
 */
struct Conversion {
    Real anomaly{0.0};
    bool clamped{false};    ///< Input was at or beyond a hyperbolic asymptote
};

// ============================================================================
// Mean Anomaly
// ============================================================================

/// sqrt(mu / |a|^3), radians per day
Real mean_motion(Real a, Real mu);

/// M0 + n * dt, wrapped to [0, 2pi) only when not hyperbolic
Real propagate_mean_anomaly(Real m0, Real n, Real dt, bool hyperbolic);

// ============================================================================
// Solvers
// ============================================================================

/**
 * @brief Solve M = E - e sin E
 *
 * Seed E = M for e < 0.8, otherwise pi. Returns E = M for e < 1e-10.
 */
SolverResult solve_elliptic(Real mean_anomaly, Real e);

/**
 * @brief Solve M = e sinh H - H
 *
 * Seeded with asinh(M/e). Iterates are bounded so sinh and cosh stay
 * finite; a step more than twice the previous one is halved.
 */
SolverResult solve_hyperbolic(Real mean_anomaly, Real e);

// ============================================================================
// Conversions
// ============================================================================

/// True anomaly in [0, 2pi)
Real eccentric_to_true(Real eccentric_anomaly, Real e);

/// Signed true anomaly in (-nu_max, nu_max); clamped flags an asymptotic H
Conversion hyperbolic_to_true(Real hyperbolic_anomaly, Real e);

Real true_to_eccentric(Real true_anomaly, Real e);

/// Clamps the atanh argument at 0.9999999 and flags it
Conversion true_to_hyperbolic(Real true_anomaly, Real e);

/// acos(-1/e)
Real hyperbolic_true_anomaly_limit(Real e);

/// Mean anomaly from eccentric anomaly (E - e sin E)
Real eccentric_to_mean(Real eccentric_anomaly, Real e);

/// Mean anomaly from hyperbolic anomaly (e sinh H - H)
Real hyperbolic_to_mean(Real hyperbolic_anomaly, Real e);

} // namespace conics::orbital::anomaly
