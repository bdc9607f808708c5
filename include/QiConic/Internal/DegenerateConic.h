#pragma once

/**
 * @file DegenerateConic.h
 * @brief Decomposition of degenerate conics into line pairs
 *
 * A degenerate conic (det = 0) is the product of two, possibly complex or
 * coincident, lines: (P x + Q y + R)(S x + T y + U) = 0. Its symmetric matrix
 * has rank <= 2. Adding a suitable multiple of an anti-symmetric matrix keeps
 * the zero set unchanged and brings the matrix to rank 1, after which one line
 * can be read off a row and the other off a column.
 *
 * Used by:
 * - Conic/ConicIntersection.h
 */

#include <QiConic/Internal/ComplexMatrix.h>
#include <QiConic/Internal/Polynomial.h>

#include <optional>

namespace Qi::Conic::Internal {

/**
 * @brief Anti-symmetric correction matrix for a rank-2 conic
 *
 * With r = DominantRow(Adjugate(m), true), the homogeneous crossing point of
 * the two lines:
 *   [  0   r2  -r1 ]
 *   [ -r2   0   r0 ]
 *   [  r1  -r0   0 ]
 */
Mat33c AntiSymmetricMatrix(const Mat33c& m);

/**
 * @brief Roots t making the 2x2 minor (rows i, j; columns i, j) of m + t * s vanish
 *
 * For (i, j) = (0, 1):
 *   (s01 s10 - s00 s11) t^2 + (-s11 m00 + s10 m01 + s01 m10 - s00 m11) t
 *   + (m01 m10 - m00 m11) = 0
 */
PolynomialRoots RankOneCorrectionRoots(const Mat33c& m, const Mat33c& s, int i, int j);

/**
 * @brief Scale t such that m + t * s has rank 1
 *
 * Uses the first root of the (0,1) minor. When that quadratic has no roots or
 * is satisfied by every t, which happens when the lines cross at infinity,
 * the (0,2) and then the (1,2) minor are tried. Empty when no minor yields a
 * root, which means m is already rank 1.
 */
std::optional<Complex> ComputeRankOneCorrection(const Mat33c& m, const Mat33c& s);

/**
 * @brief Rank-1 form of a degenerate conic matrix
 * @return m + t * AntiSymmetricMatrix(m), or m unchanged when no t exists
 */
Mat33c ToRankOne(const Mat33c& m);

/**
 * @brief Split a degenerate conic into its two lines
 *
 * The first line is the dominant row and the second the dominant column of the
 * rank-1 form.
 */
LinePair DecomposeDegenerateConic(const Mat33c& m);

/**
 * @brief Symmetric conic matrix of the line pair (l1)(l2) = 0
 * Inverse of DecomposeDegenerateConic up to scale.
 */
Mat33c ComposeLinePair(const ComplexLine& l1, const ComplexLine& l2);

} // namespace Qi::Conic::Internal
