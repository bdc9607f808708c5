#pragma once

/**
 * @file Intersection.h
 * @brief Intersection of complex homogeneous lines
 *
 * Used by:
 * - Conic/ConicIntersection.h (crossing the line pairs of pencil members)
 *
 * Design principles:
 * - Pure function, no global state
 * - Only real-valued crossings are reported; complex crossings are "no
 *   intersection", never an error
 */

#include <QiConic/Core/Constants.h>
#include <QiConic/Core/Types.h>
#include <QiConic/Internal/ComplexMatrix.h>

#include <optional>

namespace Qi::Conic::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for parallel lines and negligible b coefficients
constexpr double LINE_INTERSECTION_TOLERANCE = 1e-8;

/// Largest imaginary part accepted on the intersection coordinates
constexpr double LINE_INTERSECTION_IMAGINARY_TOLERANCE = REAL_TOLERANCE;

// =============================================================================
// Line-Line Intersection
// =============================================================================

/**
 * @brief Real intersection point of two complex lines
 *
 * For a1 x + b1 y + c1 = 0 and a2 x + b2 y + c2 = 0:
 *   x = (b2 c1 - b1 c2) / (a2 b1 - a1 b2)
 * and y follows from whichever line has a non-negligible b coefficient.
 *
 * @return The point if the lines cross at a real point, empty if they are
 *         parallel, both vertical, or cross at a complex point
 */
std::optional<Point2d> IntersectComplexLines(const ComplexLine& line1, const ComplexLine& line2);

} // namespace Qi::Conic::Internal
