/**
 * @file vector.cpp
 * @brief Vector math implementation
 */

#include "conics/core/types.h"
#include "conics/core/constants.h"
#include <cmath>
#include <algorithm>

namespace conics {

// ============================================================================
// Vec3 Member Function Implementations
// ============================================================================

Real Vec3::length() const noexcept {
    return std::sqrt(x*x + y*y + z*z);
}

Vec3 Vec3::normalized() const noexcept {
    Real len = length();
    if (len > 1e-15) {
        return {x / len, y / len, z / len};
    }
    return *this;
}

bool Vec3::is_finite() const noexcept {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

// ============================================================================
// Free Function Utilities
// ============================================================================

namespace math {

Real distance(const Vec3& a, const Vec3& b) {
    return (a - b).length();
}

Vec3 lerp(const Vec3& a, const Vec3& b, Real t) {
    return a + (b - a) * t;
}

Real angle_between(const Vec3& a, const Vec3& b) {
    Real len_a = a.length();
    Real len_b = b.length();
    if (len_a < 1e-15 || len_b < 1e-15) {
        return 0.0;
    }
    return std::acos(clamp_unit(a.dot(b) / (len_a * len_b)));
}

bool are_nearly_equal(const Vec3& a, const Vec3& b, Real epsilon) {
    return (a - b).length_squared() < epsilon * epsilon;
}

Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, Real angle) {
    Vec3 k = axis.normalized();
    Real c = std::cos(angle);
    Real s = std::sin(angle);
    return v * c + k.cross(v) * s + k * (k.dot(v) * (1.0 - c));
}

Real wrap_two_pi(Real angle) {
    Real wrapped = std::fmod(angle, constants::TWO_PI);
    if (wrapped < 0.0) {
        wrapped += constants::TWO_PI;
    }
    // fmod of a tiny negative value can round up to exactly 2*pi
    if (wrapped >= constants::TWO_PI) {
        wrapped = 0.0;
    }
    return wrapped;
}

Real clamp_unit(Real value) {
    return std::clamp(value, -1.0, 1.0);
}

} // namespace math

} // namespace conics
