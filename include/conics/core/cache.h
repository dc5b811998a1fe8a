#pragma once
/**
 * @file cache.h
 * @brief Single-slot content-hash cache with expiry
 *
 * Holds the most recent value for one key. A lookup hits only when the key
 * matches and the entry is younger than the TTL. Values are shared
 * read-only; storing replaces the whole entry.
 */

#include "conics/core/types.h"
#include <chrono>
#include <memory>

namespace conics {

template<typename T>
class ContentCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit ContentCache(Real ttl_ms = 500.0) : ttl_ms_(ttl_ms) {}

    /**
     * @brief Fetch the entry for key, or nullptr on miss or expiry
     */
    std::shared_ptr<const T> find(UInt64 key, TimePoint now = Clock::now()) const {
        if (!value_ || key != key_) {
            return nullptr;
        }
        std::chrono::duration<Real, std::milli> age = now - stored_at_;
        if (age.count() > ttl_ms_ || age.count() < 0.0) {
            return nullptr;
        }
        return value_;
    }

    /**
     * @brief Replace the entry
     */
    std::shared_ptr<const T> store(UInt64 key, T value, TimePoint now = Clock::now()) {
        value_ = std::make_shared<const T>(std::move(value));
        key_ = key;
        stored_at_ = now;
        return value_;
    }

    void invalidate() { value_.reset(); }

    bool empty() const { return !value_; }
    Real ttl_ms() const { return ttl_ms_; }
    void set_ttl_ms(Real ttl_ms) { ttl_ms_ = ttl_ms; }

private:
    std::shared_ptr<const T> value_;
    UInt64 key_{0};
    TimePoint stored_at_{};
    Real ttl_ms_;
};

/**
 * @brief FNV-1a accumulator over rounded numeric inputs
 */
class HashBuilder {
public:
    /// Mix a value rounded to the given quantum
    HashBuilder& add(Real value, Real quantum);
    HashBuilder& add(UInt64 value);
    UInt64 value() const { return hash_; }

private:
    UInt64 hash_{14695981039346656037ULL};
};

} // namespace conics
