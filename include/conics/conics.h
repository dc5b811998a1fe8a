#pragma once
/**
 * @file conics.h
 * @brief Main include file for Conics
 *
 * Patched-conics orbital mechanics: Kepler propagation, sphere-of-influence
 * transitions, sail thrust, trajectory prediction and encounter analysis.
 */

#include "conics/core/types.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include "conics/core/time.h"

#include "conics/orbital/anomaly.h"
#include "conics/orbital/conversion.h"
#include "conics/orbital/elements.h"
#include "conics/orbital/thrust.h"
#include "conics/orbital/soi.h"
#include "conics/orbital/propagator.h"
#include "conics/orbital/prediction.h"
#include "conics/orbital/intersection.h"
#include "conics/orbital/gravity_assist.h"

#include "conics/bodies/body.h"
#include "conics/events/event_dispatcher.h"

#include "conics/interface/api.h"
#include "conics/interface/config.h"

/**
 * @namespace conics
 * @brief Root namespace for all Conics components
 */
namespace conics {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/**
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* GetVersionString() noexcept {
    return "0.1.0";
}

} // namespace conics
