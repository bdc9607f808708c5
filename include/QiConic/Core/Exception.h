#pragma once

#include <QiConic/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for QiConic
 */

#include <stdexcept>
#include <string>

namespace Qi::Conic {

/**
 * @brief Base exception class for QiConic
 */
class QICONIC_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class QICONIC_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief No usable complex solution could be found on a degenerate conic
 *
 * Raised when neither probe axis yields a root while extracting the real
 * solutions of a pencil member. Signals an unanticipated conic degeneracy;
 * callers should treat it as a hard failure.
 */
class QICONIC_API UnsolvableBootstrapException : public Exception {
public:
    explicit UnsolvableBootstrapException(const std::string& message)
        : Exception("Unsolvable bootstrap: " + message) {}
};

} // namespace Qi::Conic
