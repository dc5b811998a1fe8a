/**
 * @file matrix.cpp
 * @brief Matrix math implementation
 */

#include "conics/core/types.h"
#include <cmath>

namespace conics {

// ============================================================================
// Elementary Rotations
// ============================================================================

Mat3x3 Mat3x3::RotationX(Real angle) noexcept {
    Real c = std::cos(angle);
    Real s = std::sin(angle);
    Mat3x3 result;
    result(1, 1) = c;  result(1, 2) = -s;
    result(2, 1) = s;  result(2, 2) = c;
    return result;
}

Mat3x3 Mat3x3::RotationZ(Real angle) noexcept {
    Real c = std::cos(angle);
    Real s = std::sin(angle);
    Mat3x3 result;
    result(0, 0) = c;  result(0, 1) = -s;
    result(1, 0) = s;  result(1, 1) = c;
    return result;
}

} // namespace conics
