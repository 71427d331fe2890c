#pragma once

#include <stdexcept>
#include <string>

namespace SMI {

/**
 * @brief A looked-up Value was extracted as a kind it does not hold
 *
 * Signals a defect in generated code or in an observer. Not meant to be
 * recovered from.
 */
class KindMismatchError : public std::logic_error {
public:
    KindMismatchError(const std::string &expected, const std::string &actual)
        : std::logic_error("Value kind mismatch: expected " + expected + ", found " + actual), expected_(expected),
          actual_(actual) {}

    const std::string &expected() const {
        return expected_;
    }

    const std::string &actual() const {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A live StateInstance/MethodInstance was coerced to the wrong concrete shape
 */
class ShapeMismatchError : public std::logic_error {
public:
    explicit ShapeMismatchError(const std::string &message) : std::logic_error(message) {}
};

}  // namespace SMI
