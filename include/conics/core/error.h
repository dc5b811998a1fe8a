#pragma once
/**
 * @file error.h
 * @brief Contract-violation exceptions
 */

#include <stdexcept>
#include <string>

namespace conics {

/**
 * @brief Two states from different reference frames were combined
 *
 * Raised at API boundaries. Never caught inside the engine.
 */
class FrameMismatchError : public std::logic_error {
public:
    explicit FrameMismatchError(const std::string& what)
        : std::logic_error("Frame mismatch: " + what) {}
};

} // namespace conics
