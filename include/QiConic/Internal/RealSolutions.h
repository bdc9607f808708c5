#pragma once

/**
 * @file RealSolutions.h
 * @brief Real points on a complex degenerate conic
 *
 * A degenerate conic may be a pair of complex-conjugate lines whose only real
 * point is their crossing, which is not visible from the decomposed lines
 * alone. This module works on the conic equation directly:
 *
 * 1. Find one or two complex solutions by fixing x (or y) to a probe constant
 *    and solving the remaining quadratic.
 * 2. Treat each solution as a point (Re x, Re y, Im x, Im y) in R^4. The real
 *    and imaginary parts of the conic's gradient are two normals; Gram-Schmidt
 *    against two fixed probe vectors gives a 2D basis of directions that stay
 *    on the conic to first order.
 * 3. The imaginary (z, w) part of that basis decides whether the solution can
 *    be moved onto the real plane: uniquely (rank 2), along a whole real line
 *    (rank 1), or not at all (rank 0).
 *
 * Used by:
 * - Conic/ConicIntersection.h (tangency self-check per pencil member)
 */

#include <QiConic/Core/Constants.h>
#include <QiConic/Core/Types.h>
#include <QiConic/Internal/ComplexMatrix.h>

#include <vector>

namespace Qi::Conic::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Probe value used to fix one coordinate when searching for complex solutions
inline const Complex CONIC_PROBE_ALPHA{-2.51653525696959, 1.52928502844020};

/// First arbitrary 4D probe direction for the Gram-Schmidt basis
inline const Vec4 CONIC_PROBE_DIRECTION_A{6.1951068548253, -1.1592689503860,
                                         0.1602918829294, 3.205818692048202};

/// Second arbitrary 4D probe direction for the Gram-Schmidt basis
inline const Vec4 CONIC_PROBE_DIRECTION_B{-5.420628549296924, -15.2069583028685,
                                         0.1595906020488680, 5.10688288040682};

/// Singular value tolerance for classifying the imaginary basis
constexpr double REAL_SOLUTION_RANK_TOLERANCE = RANK_TOLERANCE;

/// Residual imaginary part accepted as real
constexpr double REAL_SOLUTION_IMAGINARY_TOLERANCE = REAL_TOLERANCE;

/// Squared gradient norm below which a solution is a singular point
constexpr double REAL_SOLUTION_GRADIENT_EPSILON = 1e-24;

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief A real solution: a single point, or a whole line through a point
 */
struct RealSolution {
    Point2d point;              ///< Real point on the conic
    bool isRay = false;         ///< True if every point along direction also lies on the conic
    Point2d direction;          ///< Unit direction (only meaningful when isRay)

    bool IsRay() const { return isRay; }

    Ray2d ToRay() const { return Ray2d(point, direction); }

    static RealSolution Point(const Point2d& p) {
        RealSolution s;
        s.point = p;
        return s;
    }

    static RealSolution Line(const Point2d& p, const Point2d& dir) {
        RealSolution s;
        s.point = p;
        s.isRay = true;
        s.direction = Ray2d(p, dir).direction;
        return s;
    }
};

/**
 * @brief Outcome of real solution extraction
 */
enum class RealSolutionStatus {
    Ok,                 ///< Extraction ran; solutions may still be empty
    BootstrapFailed     ///< No complex solution found on either probe axis
};

/**
 * @brief Real solutions of one degenerate conic
 */
struct RealSolutionSet {
    RealSolutionStatus status = RealSolutionStatus::Ok;
    std::vector<RealSolution> solutions;

    bool Ok() const { return status == RealSolutionStatus::Ok; }
    bool Empty() const { return solutions.empty(); }
    int Count() const { return static_cast<int>(solutions.size()); }
};

/**
 * @brief Complex point (x, y) on a conic
 */
struct ComplexPoint {
    Complex x;
    Complex y;
};

// =============================================================================
// Functions
// =============================================================================

/**
 * @brief Find up to two complex solutions of the conic equation
 *
 * Fixes x = CONIC_PROBE_ALPHA and solves for y; if that does not give two
 * roots, fixes y and solves for x; if neither gives two, accepts a single root
 * from the x probe, then the y probe.
 *
 * @param m Conic matrix
 * @param[out] points Complex solutions (cleared first)
 * @return false if neither probe axis produced any root
 */
bool FindComplexSolutions(const Mat33c& m, std::vector<ComplexPoint>& points);

/**
 * @brief Real points (or real lines) lying on a degenerate conic
 *
 * @param m Conic matrix of a pencil member (before rank-1 correction)
 * @return Solutions with status Ok, or status BootstrapFailed with no
 *         solutions when FindComplexSolutions fails
 */
RealSolutionSet ExtractRealSolutions(const Mat33c& m);

} // namespace Qi::Conic::Internal
