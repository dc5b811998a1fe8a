#pragma once
/**
 * @file time.h
 * @brief Simulation clock in Julian days
 *
 * Tracks the authoritative simulation time, time scaling and step counting.
 * Time is never read from a wall clock; the driver supplies every increment.
 */

#include "conics/core/types.h"

namespace conics::core {

/**
 * @brief Simulation time management
 *
 * Handles:
 * - Epoch initialization and explicit time setting
 * - Time scaling (game speed)
 * - Maximum per-step increment
 * - Pause/resume
 */
class TimeManager {
public:
    TimeManager();
    ~TimeManager();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Initialize at an epoch
     * @param epoch Julian date of simulation start
     * @param max_step Largest scaled increment accepted per advance (days, 0 = unlimited)
     */
    void initialize(Real epoch, Real max_step = 0.0);

    /**
     * @brief Return to the initialization epoch
     */
    void reset();

    // ========================================================================
    // Time Control
    // ========================================================================

    /**
     * @brief Advance simulation time
     * @param dt Unscaled increment in days
     * @return Scaled increment actually applied (0 while paused)
     */
    Real advance(Real dt);

    void pause() { paused_ = true; }
    void resume() { paused_ = false; }
    bool is_paused() const { return paused_; }

    /**
     * @brief Jump to an explicit time (planning mode, loading a scenario)
     */
    void set_time(Real julian_date);

    // ========================================================================
    // Access
    // ========================================================================

    Real get_time() const { return time_; }
    Real get_epoch() const { return epoch_; }
    Real get_elapsed_days() const { return time_ - epoch_; }
    Real get_last_step() const { return last_step_; }
    UInt64 get_step_count() const { return step_count_; }

    Real get_time_scale() const { return time_scale_; }

    /**
     * @brief Set time scale factor
     * @param scale Scale factor, clamped to [0, 1e6]
     */
    void set_time_scale(Real scale);

private:
    Real epoch_{0.0};
    Real time_{0.0};
    Real last_step_{0.0};
    Real max_step_{0.0};
    Real time_scale_{1.0};
    UInt64 step_count_{0};
    bool paused_{false};
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Julian date from a calendar date (Gregorian, UTC)
 */
Real julian_date(int year, int month, int day,
                 int hour = 0, int minute = 0, Real second = 0.0);

/**
 * @brief Days elapsed since J2000.0
 */
Real days_since_j2000(Real julian_date);

} // namespace conics::core
