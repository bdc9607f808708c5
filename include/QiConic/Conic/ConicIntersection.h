#pragma once

/**
 * @file ConicIntersection.h
 * @brief Intersection points of two conics via the pencil of conics
 *
 * This module provides:
 * - IntersectConics: real intersection points of two non-degenerate conics
 * - ConicIntersectionParams: residual filter and trace configuration
 * - ConicIntersectionResult: points plus the pencil diagnostics
 *
 * Algorithm:
 * 1. det(l * A + B) = 0 is a cubic in l; its roots give the (up to three)
 *    degenerate members of the pencil spanned by A and B
 * 2. Every degenerate member is a line pair through all intersection points
 * 3. Crossing the line pairs of two members (and each member's own pair,
 *    which catches tangency) yields the candidate points
 * 4. Candidates that do not lie on both input conics are discarded
 *
 * Limitations:
 * - Inputs are assumed non-degenerate (not line pairs)
 * - Some degenerate pencil members (e.g. the doubled line at infinity of two
 *   concentric circles) defeat the complex-solution probe; this is reported
 *   as UnsolvableBootstrapException
 */

#include <QiConic/Conic/Conic2d.h>
#include <QiConic/Core/Complex.h>
#include <QiConic/Core/Export.h>
#include <QiConic/Core/Trace.h>
#include <QiConic/Core/Types.h>
#include <QiConic/Internal/ComplexMatrix.h>
#include <QiConic/Internal/RealSolutions.h>

#include <array>
#include <utility>
#include <vector>

namespace Qi::Conic {

// =============================================================================
// Constants
// =============================================================================

/// Default normalized residual above which a candidate point is rejected
constexpr double CONIC_RESIDUAL_TOLERANCE = 1e-6;

/// Default distance below which two points count as the same point
constexpr double CONIC_POINT_MERGE_TOLERANCE = 1e-6;

// =============================================================================
// Parameters / Result
// =============================================================================

/**
 * @brief Parameters for IntersectConics
 */
struct QICONIC_API ConicIntersectionParams {
    /// Reject candidates with |Q(p)| / (max|M| * max(1, |p|^2)) above this on
    /// either conic. A negative value keeps every real line crossing.
    double residualTolerance = CONIC_RESIDUAL_TOLERANCE;

    bool trace = false;             ///< Emit trace events (also enabled by QICONIC_TRACE)
    TraceCallback traceCallback;    ///< Trace sink; stderr when empty

    ConicIntersectionParams& SetResidualTolerance(double tol) { residualTolerance = tol; return *this; }
    ConicIntersectionParams& SetTrace(bool enable) { trace = enable; return *this; }
    ConicIntersectionParams& SetTraceCallback(TraceCallback cb) {
        traceCallback = std::move(cb);
        trace = true;
        return *this;
    }
};

/**
 * @brief Result of IntersectConics
 *
 * The same point is typically found by several line pairs, so `points` may
 * contain duplicates. UniquePoints() merges them.
 */
struct QICONIC_API ConicIntersectionResult {
    std::vector<Point2d> points;                                ///< Real intersection points
    std::vector<Complex> lambdas;                               ///< Unique pencil parameters
    std::vector<Internal::Mat33c> degenerateConicMatrices;      ///< l * A + B per lambda
    std::vector<Internal::LinePair> lines;                      ///< Line pair per member
    std::vector<std::vector<Internal::RealSolution>> intersectionCollections; ///< Real solutions per member
    int rejectedCount = 0;                                      ///< Crossings dropped by the residual filter
    bool overlapping = false;                                   ///< Conics look identical (infinitely many points)

    int Count() const { return static_cast<int>(points.size()); }
    bool Empty() const { return points.empty(); }

    /// Points with duplicates (closer than tolerance) merged, in first-seen order
    std::vector<Point2d> UniquePoints(double tolerance = CONIC_POINT_MERGE_TOLERANCE) const;
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Real intersection points of two conics
 *
 * Returns an empty result (overlapping = true) when the pencil cubic has no
 * usable roots or a pencil member vanishes, which happens for identical or
 * proportional conics.
 *
 * @param a First conic
 * @param b Second conic
 * @param params Residual filter and tracing
 * @return Points and pencil diagnostics
 *
 * @throws InvalidArgumentException if either conic has a non-finite entry
 * @throws UnsolvableBootstrapException if no complex solution of a pencil
 *         member can be found
 */
QICONIC_API ConicIntersectionResult IntersectConics(const Conic2d& a, const Conic2d& b,
                                                    const ConicIntersectionParams& params = ConicIntersectionParams());

/**
 * @brief Coefficients (A, B, C, D) of det(l * a + b) = A l^3 + B l^2 + C l + D
 */
QICONIC_API std::array<double, 4> PencilCubicCoefficients(const Conic2d& a, const Conic2d& b);

/**
 * @brief Normalized residual |Q(p)| / (max|M| * max(1, x^2 + y^2))
 *
 * Scale-free measure of how far p is from lying on the conic.
 */
QICONIC_API double NormalizedResidual(const Conic2d& conic, const Point2d& p);

} // namespace Qi::Conic
