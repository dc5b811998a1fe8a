/**
 * @file anomaly.cpp
 * @brief Kepler equation solvers
 */

#include "conics/orbital/anomaly.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include "conics/core/types.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace conics::orbital::anomaly {

using namespace constants;

// ============================================================================
// Mean Anomaly
// ============================================================================

Real mean_motion(Real a, Real mu)
{
    Real abs_a = std::abs(a);
    return std::sqrt(mu / (abs_a * abs_a * abs_a));
}

Real propagate_mean_anomaly(Real m0, Real n, Real dt, bool hyperbolic)
{
    Real m = m0 + n * dt;
    if (!hyperbolic) {
        m = math::wrap_two_pi(m);
    }
    return m;
}

// ============================================================================
// Solvers
// ============================================================================

SolverResult solve_elliptic(Real mean_anomaly, Real e)
{
    SolverResult result;
    if (e < CIRCULAR_ECCENTRICITY) {
        result.anomaly = mean_anomaly;
        return result;
    }

    Real E = (e < ELLIPTIC_SEED_SWITCH) ? mean_anomaly : PI;

    for (int i = 0; i < KEPLER_MAX_ITERATIONS; ++i) {
        Real f = E - e * std::sin(E) - mean_anomaly;
        Real f_prime = 1.0 - e * std::cos(E);
        Real delta = f / f_prime;
        E -= delta;
        result.iterations = i + 1;

        if (std::abs(delta) < KEPLER_TOLERANCE) {
            result.anomaly = E;
            return result;
        }
    }

    Logger::debug("Elliptic Kepler solve did not converge (M={}, e={})", mean_anomaly, e);
    result.anomaly = E;
    result.converged = false;
    return result;
}

SolverResult solve_hyperbolic(Real mean_anomaly, Real e)
{
    SolverResult result;
    Real H = std::clamp(std::asinh(mean_anomaly / e),
                        -MAX_HYPERBOLIC_ANOMALY, MAX_HYPERBOLIC_ANOMALY);
    Real prev_delta = std::numeric_limits<Real>::infinity();

    for (int i = 0; i < KEPLER_MAX_ITERATIONS; ++i) {
        Real f = e * std::sinh(H) - H - mean_anomaly;
        Real f_prime = e * std::cosh(H) - 1.0;
        result.iterations = i + 1;

        if (std::abs(f_prime) < 1e-15) {
            break;
        }

        Real delta = f / f_prime;
        if (std::abs(delta) > 2.0 * std::abs(prev_delta)) {
            H -= 0.5 * delta;
        } else {
            H -= delta;
        }
        H = std::clamp(H, -MAX_HYPERBOLIC_ANOMALY, MAX_HYPERBOLIC_ANOMALY);

        if (std::abs(delta) < KEPLER_TOLERANCE) {
            result.anomaly = H;
            return result;
        }
        prev_delta = delta;
    }

    Logger::debug("Hyperbolic Kepler solve did not converge (M={}, e={})", mean_anomaly, e);
    result.anomaly = H;
    result.converged = false;
    return result;
}

// ============================================================================
// Conversions
// ============================================================================

Real eccentric_to_true(Real eccentric_anomaly, Real e)
{
    if (e < CIRCULAR_ECCENTRICITY) {
        return math::wrap_two_pi(eccentric_anomaly);
    }
    Real y = std::sqrt(1.0 - e * e) * std::sin(eccentric_anomaly);
    Real x = std::cos(eccentric_anomaly) - e;
    return math::wrap_two_pi(std::atan2(y, x));
}

Conversion hyperbolic_to_true(Real hyperbolic_anomaly, Real e)
{
    Conversion result;
    Real tanh_half = std::tanh(hyperbolic_anomaly / 2.0);
    if (std::abs(tanh_half) >= 1.0 - ASYMPTOTE_EPSILON) {
        result.clamped = true;
        tanh_half = std::copysign(1.0 - ASYMPTOTE_EPSILON, tanh_half);
    }
    Real factor = std::sqrt((e + 1.0) / (e - 1.0));
    result.anomaly = 2.0 * std::atan(factor * tanh_half);
    return result;
}

Real true_to_eccentric(Real true_anomaly, Real e)
{
    Real y = std::sqrt(1.0 - e * e) * std::sin(true_anomaly);
    Real x = e + std::cos(true_anomaly);
    return math::wrap_two_pi(std::atan2(y, x));
}

Conversion true_to_hyperbolic(Real true_anomaly, Real e)
{
    Conversion result;
    Real factor = std::sqrt((e - 1.0) / (e + 1.0));
    Real tanh_half = factor * std::tan(true_anomaly / 2.0);
    if (std::abs(tanh_half) >= ATANH_LIMIT || !std::isfinite(tanh_half)) {
        Logger::debug("True anomaly {} near asymptote for e={}, clamping", true_anomaly, e);
        tanh_half = std::copysign(ATANH_LIMIT, tanh_half);
        result.clamped = true;
    }
    result.anomaly = 2.0 * std::atanh(tanh_half);
    return result;
}

Real hyperbolic_true_anomaly_limit(Real e)
{
    return std::acos(-1.0 / e);
}

Real eccentric_to_mean(Real eccentric_anomaly, Real e)
{
    return eccentric_anomaly - e * std::sin(eccentric_anomaly);
}

Real hyperbolic_to_mean(Real hyperbolic_anomaly, Real e)
{
    return e * std::sinh(hyperbolic_anomaly) - hyperbolic_anomaly;
}

} // namespace conics::orbital::anomaly
