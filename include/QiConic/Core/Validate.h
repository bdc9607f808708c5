#pragma once

/**
 * @file Validate.h
 * @brief Unified argument validation utilities for QiConic
 *
 * Design principles:
 * - Invalid input throws InvalidArgumentException, never returns silently
 * - Consistent error message format: "<func>: <what> (got <value>)"
 */

#include <QiConic/Core/Exception.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Qi::Conic::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

} // namespace Detail

// =============================================================================
// Scalar Validation
// =============================================================================

/**
 * @brief Require a finite value (no NaN or Inf)
 * @throws InvalidArgumentException otherwise
 */
inline void RequireFinite(double value, const char* name, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name +
                                       " must be finite (got " + Detail::FormatValue(value) + ")");
    }
}

/**
 * @brief Require a finite value >= 0
 * @throws InvalidArgumentException otherwise
 */
inline void RequireNonNegative(double value, const char* name, const char* funcName) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name +
                                       " must be >= 0 (got " + Detail::FormatValue(value) + ")");
    }
}

/**
 * @brief Require a finite value > 0
 * @throws InvalidArgumentException otherwise
 */
inline void RequirePositive(double value, const char* name, const char* funcName) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name +
                                       " must be > 0 (got " + Detail::FormatValue(value) + ")");
    }
}

// =============================================================================
// Object Validation
// =============================================================================

/**
 * @brief Require obj.IsValid()
 * @tparam T Any type with a bool IsValid() const member
 * @throws InvalidArgumentException otherwise
 */
template<typename T>
inline void RequireValid(const T& obj, const char* name, const char* funcName) {
    if (!obj.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name + " is invalid");
    }
}

} // namespace Qi::Conic::Validate
