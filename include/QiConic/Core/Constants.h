#pragma once

/**
 * @file Constants.h
 * @brief Mathematical constants and global tolerances for QiConic
 */

namespace Qi::Conic {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

/// General purpose floating point tolerance
constexpr double EPSILON = 1e-12;

/// Tolerance for treating a complex component as zero in final results
constexpr double REAL_TOLERANCE = 1e-8;

/// Tolerance for rank decisions on small matrices
constexpr double RANK_TOLERANCE = 1e-10;

} // namespace Qi::Conic
