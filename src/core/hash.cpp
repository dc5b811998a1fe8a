/**
 * @file hash.cpp
 * @brief Content hash for cache keys
 */

#include "conics/core/cache.h"
#include <bit>
#include <cmath>

namespace conics {

namespace {
constexpr UInt64 FNV_PRIME = 1099511628211ULL;
}

HashBuilder& HashBuilder::add(UInt64 value)
{
    for (int i = 0; i < 8; ++i) {
        hash_ ^= (value >> (i * 8)) & 0xFFULL;
        hash_ *= FNV_PRIME;
    }
    return *this;
}

HashBuilder& HashBuilder::add(Real value, Real quantum)
{
    if (!std::isfinite(value)) {
        return add(static_cast<UInt64>(0xFFFFFFFFFFFFFFFFULL));
    }
    Real rounded = std::round(value / quantum);
    if (std::abs(rounded) >= 9.0e18) {
        return add(std::bit_cast<UInt64>(rounded));
    }
    return add(static_cast<UInt64>(static_cast<Int64>(rounded)));
}

} // namespace conics
