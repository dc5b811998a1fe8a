#pragma once
/**
 * @file types.h
 * @brief Core type definitions for Conics
 *
 * Numeric aliases, the lightweight vector and matrix structures used by the
 * orbital code, and the identifiers shared across modules.
 */

#include <cstdint>
#include <cstddef>
#include <limits>

namespace conics {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for orbital calculations
 *
 * Double precision throughout: heliocentric distances in AU combined with
 * SOI-relative offsets of 1e-5 AU need the full mantissa.
 */
using Real = double;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt16 = std::uint16_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Identifier of a celestial body in a BodyCatalog
 */
using BodyId = UInt32;

/// Invalid / absent body
constexpr BodyId INVALID_BODY_ID = std::numeric_limits<BodyId>::max();

/**
 * @brief Identifier of a ship registered with the Engine
 */
using ShipId = UInt32;

constexpr ShipId INVALID_SHIP_ID = std::numeric_limits<ShipId>::max();

// ============================================================================
// Math Structures
// ============================================================================

struct Vec3;
struct Mat3x3;

/**
 * @brief 3D vector (position in AU, velocity in AU/day, acceleration)
 */
struct Vec3 {
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Vec3() noexcept = default;
    constexpr Vec3(Real x_, Real y_, Real z_) noexcept : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr Vec3 operator-(const Vec3& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr Vec3 operator*(Real scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }
    constexpr Vec3 operator/(Real scalar) const noexcept {
        return {x / scalar, y / scalar, z / scalar};
    }
    constexpr Vec3 operator-() const noexcept {
        return {-x, -y, -z};
    }
    friend constexpr Vec3 operator*(Real scalar, const Vec3& v) noexcept {
        return {v.x * scalar, v.y * scalar, v.z * scalar};
    }

    constexpr Vec3& operator+=(const Vec3& other) noexcept {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }
    constexpr Vec3& operator-=(const Vec3& other) noexcept {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }
    constexpr Vec3& operator*=(Real scalar) noexcept {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    constexpr bool operator==(const Vec3& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr Real dot(const Vec3& other) const noexcept {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const noexcept {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr Real length_squared() const noexcept {
        return x*x + y*y + z*z;
    }

    // Defined in vector.cpp
    Real length() const noexcept;
    Vec3 normalized() const noexcept;
    bool is_finite() const noexcept;

    static constexpr Vec3 Zero() noexcept { return {0.0, 0.0, 0.0}; }
    static constexpr Vec3 UnitX() noexcept { return {1.0, 0.0, 0.0}; }
    static constexpr Vec3 UnitY() noexcept { return {0.0, 1.0, 0.0}; }
    static constexpr Vec3 UnitZ() noexcept { return {0.0, 0.0, 1.0}; }
};

/**
 * @brief 3x3 matrix (frame rotations)
 *
 * Row-major storage: m[row*3 + col]
 */
struct Mat3x3 {
    Real m[9]{1, 0, 0, 0, 1, 0, 0, 0, 1};

    constexpr Mat3x3() noexcept = default;

    constexpr Real& operator()(SizeT row, SizeT col) noexcept {
        return m[row * 3 + col];
    }
    constexpr Real operator()(SizeT row, SizeT col) const noexcept {
        return m[row * 3 + col];
    }

    static constexpr Mat3x3 Identity() noexcept {
        return Mat3x3{};
    }

    static constexpr Mat3x3 Zero() noexcept {
        Mat3x3 result;
        for (auto& v : result.m) v = 0.0;
        return result;
    }

    constexpr Vec3 operator*(const Vec3& v) const noexcept {
        return {
            m[0]*v.x + m[1]*v.y + m[2]*v.z,
            m[3]*v.x + m[4]*v.y + m[5]*v.z,
            m[6]*v.x + m[7]*v.y + m[8]*v.z
        };
    }

    constexpr Mat3x3 operator*(const Mat3x3& other) const noexcept {
        Mat3x3 result = Zero();
        for (SizeT i = 0; i < 3; ++i) {
            for (SizeT j = 0; j < 3; ++j) {
                for (SizeT k = 0; k < 3; ++k) {
                    result(i, j) += (*this)(i, k) * other(k, j);
                }
            }
        }
        return result;
    }

    constexpr Mat3x3 transpose() const noexcept {
        Mat3x3 result;
        for (SizeT i = 0; i < 3; ++i) {
            for (SizeT j = 0; j < 3; ++j) {
                result(i, j) = (*this)(j, i);
            }
        }
        return result;
    }

    // Elementary rotations, defined in matrix.cpp
    static Mat3x3 RotationX(Real angle) noexcept;
    static Mat3x3 RotationZ(Real angle) noexcept;
};

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Engine execution state
 */
enum class SimulationState : UInt8 {
    Uninitialized,
    Initialized,
    Running,
    Paused,
    Stopped,
    Error
};

// ============================================================================
// Free Math Utilities (vector.cpp / matrix.cpp)
// ============================================================================

namespace math {

Real distance(const Vec3& a, const Vec3& b);
Vec3 lerp(const Vec3& a, const Vec3& b, Real t);
Real angle_between(const Vec3& a, const Vec3& b);
bool are_nearly_equal(const Vec3& a, const Vec3& b, Real epsilon);

/// Rotate v about a unit axis by angle (Rodrigues)
Vec3 rotate_about_axis(const Vec3& v, const Vec3& axis, Real angle);

/// Wrap an angle into [0, 2*pi)
Real wrap_two_pi(Real angle);

/// Clamp to [-1, 1] before acos/asin
Real clamp_unit(Real value);

} // namespace math

} // namespace conics
