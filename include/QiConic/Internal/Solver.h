#pragma once

/**
 * @file Solver.h
 * @brief Small dense real solvers for QiConic
 *
 * This module provides:
 * - Singular values of a 2x2 matrix (one-sided Jacobi)
 * - Numerical rank of a 2x2 matrix
 * - Direct 2x2 linear solve (Cramer's rule)
 *
 * Used by:
 * - RealSolutions.h (classifying the imaginary part of the gradient basis)
 */

#include <QiConic/Core/Constants.h>
#include <QiConic/Internal/Matrix.h>

namespace Qi::Conic::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Default tolerance for rank determination
constexpr double SOLVER_RANK_TOLERANCE = RANK_TOLERANCE;

/// Default tolerance for singularity detection
constexpr double SOLVER_SINGULAR_THRESHOLD = EPSILON;

/// Maximum Jacobi sweeps for the 2x2 SVD
constexpr int SVD_MAX_SWEEPS = 8;

// =============================================================================
// Decomposition
// =============================================================================

/**
 * @brief Singular values of a 2x2 matrix
 *
 * @param A Input matrix
 * @return Singular values in descending order (s[0] >= s[1] >= 0)
 */
Vec2 SingularValues2x2(const Mat22& A);

/**
 * @brief Numerical rank of a 2x2 matrix
 * Count of singular values above tolerance
 */
int ComputeRank2x2(const Mat22& A, double tolerance = SOLVER_RANK_TOLERANCE);

// =============================================================================
// Linear System
// =============================================================================

/**
 * @brief Solve 2x2 system directly
 * Uses Cramer's rule, avoids decomposition overhead
 * @param tolerance Determinant magnitude at or below which A counts as singular
 * @return Solution, or zero vector if singular
 */
Vec2 Solve2x2(const Mat22& A, const Vec2& b, double tolerance = SOLVER_SINGULAR_THRESHOLD);

/**
 * @brief Check if 2x2 system has unique solution
 */
bool IsSolvable2x2(const Mat22& A, double tolerance = SOLVER_SINGULAR_THRESHOLD);

} // namespace Qi::Conic::Internal
