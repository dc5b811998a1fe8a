#pragma once
/**
 * @file constants.h
 * @brief Astronomical constants and physics thresholds
 *
 * Units: AU, days, AU/day, AU^3/day^2 unless noted.
 */

#include "conics/core/types.h"

namespace conics::constants {

// ============================================================================
// Mathematical Constants
// ============================================================================

constexpr Real PI = 3.14159265358979323846;
constexpr Real TWO_PI = 2.0 * PI;
constexpr Real DEG_TO_RAD = PI / 180.0;
constexpr Real RAD_TO_DEG = 180.0 / PI;

// ============================================================================
// Astronomical Constants
// ============================================================================

/// Gravitational parameter of the Sun (AU^3/day^2)
constexpr Real MU_SUN = 2.9591220828559093e-4;

/// J2000.0 epoch (Julian date)
constexpr Real J2000 = 2451545.0;

/// Default simulation start: 7305 days after J2000
constexpr Real DEFAULT_START_EPOCH = J2000 + 7305.0;

/// Kilometers per AU
constexpr Real AU_KM = 149597870.7;

/// Meters per AU
constexpr Real AU_M = 1.495978707e11;

constexpr Real SECONDS_PER_DAY = 86400.0;

/// m/s^2 to AU/day^2
constexpr Real ACCEL_CONVERSION = SECONDS_PER_DAY * SECONDS_PER_DAY / AU_M;

/// km/s to AU/day
constexpr Real KMS_TO_AU_PER_DAY = SECONDS_PER_DAY / AU_KM;

/// Solar radiation pressure at 1 AU (N/m^2)
constexpr Real SOLAR_PRESSURE_1AU = 4.56e-6;

// ============================================================================
// Solver Constants
// ============================================================================

/// Newton-Raphson convergence tolerance for Kepler's equation
constexpr Real KEPLER_TOLERANCE = 1e-12;

/// Newton-Raphson iteration cap
constexpr int KEPLER_MAX_ITERATIONS = 50;

/// Eccentricity below which the orbit is treated as circular by the solvers
constexpr Real CIRCULAR_ECCENTRICITY = 1e-10;

/// Elliptic solver switches its seed from M to pi above this eccentricity
constexpr Real ELLIPTIC_SEED_SWITCH = 0.8;

/// Largest hyperbolic anomaly magnitude kept by the solver (sinh/cosh stay finite)
constexpr Real MAX_HYPERBOLIC_ANOMALY = 50.0;

/// atanh argument clamp for true to hyperbolic anomaly
constexpr Real ATANH_LIMIT = 0.9999999;

/// tanh(H/2) magnitude treated as asymptotic
constexpr Real ASYMPTOTE_EPSILON = 1e-12;

// ============================================================================
// Element Conversion Thresholds
// ============================================================================

constexpr Real NEAR_PARABOLIC_LOW = 0.9999;
constexpr Real NEAR_PARABOLIC_HIGH = 1.0001;

/// |specific energy| below which the orbit is treated as parabolic
constexpr Real PARABOLIC_ENERGY_EPSILON = 1e-15;

/// Semi-major axis for the parabolic energy case, as a multiple of r
constexpr Real PARABOLIC_SMA_FACTOR = 1000.0;

/// Angular momentum magnitude below which the fallback normal is used
constexpr Real ANGULAR_MOMENTUM_EPSILON = 1e-10;

/// Node length of the unit orbit normal below which the orbit is equatorial
constexpr Real NODE_EPSILON = 1e-10;

/// Orbit classification: circular below this eccentricity
constexpr Real CIRCULAR_CLASSIFICATION = 1e-6;

/// Semi-latus rectum floor
constexpr Real MIN_SEMI_LATUS_RECTUM = 1e-12;

constexpr Real MIN_SEMI_MAJOR_AXIS = 1e-6;
constexpr Real MIN_HYPERBOLIC_SMA = 1e-4;

// ============================================================================
// Physics Defaults
// ============================================================================

/// SOI exit radius multiplier
constexpr Real SOI_EXIT_HYSTERESIS = 1.01;

/// Re-entry suppression after a transition (days)
constexpr Real SOI_TRANSITION_COOLDOWN = 0.1;

/// Above this eccentricity the SOI segment is flown as a straight line
constexpr Real EXTREME_ECCENTRICITY = 50.0;

/// Safe periapsis as a multiple of the physical radius
constexpr Real MIN_PERIAPSIS_MULTIPLIER = 1.1;

/// Thrust below this magnitude (AU/day^2) is ignored
constexpr Real MIN_THRUST = 1e-20;

/// Heliocentric distance below which thrust is disabled and prediction stops
constexpr Real SUN_APPROACH_RADIUS = 0.02;

/// Solar pressure distance floor (AU)
constexpr Real MIN_PRESSURE_DISTANCE = 0.01;

constexpr Real DEFAULT_SHIP_MASS = 10000.0;

// ============================================================================
// Prediction Defaults
// ============================================================================

constexpr Real PREDICTION_DURATION_DEFAULT = 60.0;
constexpr Real PREDICTION_DURATION_MIN = 30.0;
constexpr Real PREDICTION_DURATION_MAX = 730.0;
constexpr int PREDICTION_STEPS_DEFAULT = 200;
constexpr Real PREDICTION_STEPS_PER_DAY = 5.0;
constexpr int PREDICTION_STEPS_MIN = 100;
constexpr int PREDICTION_STEPS_MAX = 2000;
constexpr Real PREDICTION_MAX_DISTANCE = 10.0;
constexpr Real PREDICTION_TIME_BUDGET_MS = 50.0;

/// Time granularity for cache hashing and crossing de-duplication (days)
constexpr Real TIME_ROUNDING = 1e-3;

constexpr Real CACHE_TTL_MS = 500.0;

// ============================================================================
// Intersection Defaults
// ============================================================================

constexpr int INTERSECTION_MAX_RESULTS = 20;
constexpr Real INTERSECTION_TIME_BUDGET_MS = 10.0;

/// Perihelion/aphelion radii are tested above this target eccentricity
constexpr Real INTERSECTION_ECCENTRICITY_THRESHOLD = 0.05;

/// Minimum separation from a for perihelion/aphelion radii (AU)
constexpr Real INTERSECTION_RADIUS_SEPARATION = 0.01;

/// V.V below which the closest-approach parameter is 0
constexpr Real CLOSEST_APPROACH_EPSILON = 1e-20;

} // namespace conics::constants
