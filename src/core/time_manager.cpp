/**
 * @file time_manager.cpp
 * @brief Time management implementation
 */

#include "conics/core/time.h"
#include "conics/core/constants.h"
#include <algorithm>
#include <cmath>

namespace conics::core {

// ============================================================================
// TimeManager Implementation
// ============================================================================

TimeManager::TimeManager() = default;
TimeManager::~TimeManager() = default;

void TimeManager::initialize(Real epoch, Real max_step)
{
    epoch_ = epoch;
    max_step_ = std::max(0.0, max_step);
    reset();
}

void TimeManager::reset()
{
    time_ = epoch_;
    last_step_ = 0.0;
    step_count_ = 0;
    paused_ = false;
}

Real TimeManager::advance(Real dt)
{
    if (paused_ || !std::isfinite(dt) || dt <= 0.0) {
        last_step_ = 0.0;
        return 0.0;
    }

    dt *= time_scale_;
    if (max_step_ > 0.0) {
        dt = std::min(dt, max_step_);
    }

    last_step_ = dt;
    time_ += dt;
    ++step_count_;
    return dt;
}

void TimeManager::set_time(Real julian_date)
{
    if (std::isfinite(julian_date)) {
        time_ = julian_date;
    }
}

void TimeManager::set_time_scale(Real scale)
{
    time_scale_ = std::clamp(scale, 0.0, 1e6);
}

// ============================================================================
// Utility Functions
// ============================================================================

Real julian_date(int year, int month, int day, int hour, int minute, Real second)
{
    // Fliegel and Van Flandern day number
    int a = (14 - month) / 12;
    int y = year + 4800 - a;
    int m = month + 12 * a - 3;

    int jdn = day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;

    Real fraction = (static_cast<Real>(hour) - 12.0) / 24.0 +
                    static_cast<Real>(minute) / 1440.0 +
                    second / constants::SECONDS_PER_DAY;

    return static_cast<Real>(jdn) + fraction;
}

Real days_since_j2000(Real jd)
{
    return jd - constants::J2000;
}

} // namespace conics::core
