/**
 * @file Solver.cpp
 * @brief Implementation of small dense real solvers
 */

#include <QiConic/Internal/Solver.h>

#include <cmath>
#include <utility>

namespace Qi::Conic::Internal {

// =============================================================================
// 2x2 SVD (one-sided Jacobi)
// =============================================================================

namespace {

/// Apply Jacobi rotation to the two columns of B (from right)
void ApplyJacobiRight(Mat22& B, double c, double s) {
    for (int i = 0; i < 2; ++i) {
        double bp = B(i, 0);
        double bq = B(i, 1);
        B(i, 0) = c * bp + s * bq;
        B(i, 1) = -s * bp + c * bq;
    }
}

} // anonymous namespace

Vec2 SingularValues2x2(const Mat22& A) {
    Mat22 B = A;
    const double tol = 1e-15;

    // Rotate the columns until they are orthogonal; their norms are then the
    // singular values
    for (int sweep = 0; sweep < SVD_MAX_SWEEPS; ++sweep) {
        double b00 = B(0, 0) * B(0, 0) + B(1, 0) * B(1, 0);
        double b01 = B(0, 0) * B(0, 1) + B(1, 0) * B(1, 1);
        double b11 = B(0, 1) * B(0, 1) + B(1, 1) * B(1, 1);

        if (std::abs(b01) <= tol * std::sqrt(b00 * b11) || std::abs(b01) < 1e-300) {
            break;
        }

        // tau = cot(2*theta), t = tan(theta) (smaller root)
        double tau = (b00 - b11) / (2.0 * b01);
        double t;
        if (tau >= 0.0) {
            t = 1.0 / (tau + std::sqrt(1.0 + tau * tau));
        } else {
            t = 1.0 / (tau - std::sqrt(1.0 + tau * tau));
        }
        double c = 1.0 / std::sqrt(1.0 + t * t);
        double s = t * c;

        ApplyJacobiRight(B, c, s);
    }

    double s0 = std::hypot(B(0, 0), B(1, 0));
    double s1 = std::hypot(B(0, 1), B(1, 1));
    if (s1 > s0) {
        std::swap(s0, s1);
    }
    return Vec2{s0, s1};
}

int ComputeRank2x2(const Mat22& A, double tolerance) {
    Vec2 s = SingularValues2x2(A);
    int rank = 0;
    for (int i = 0; i < 2; ++i) {
        if (s[i] > tolerance) {
            ++rank;
        }
    }
    return rank;
}

// =============================================================================
// 2x2 Linear System
// =============================================================================

Vec2 Solve2x2(const Mat22& A, const Vec2& b, double tolerance) {
    double det = A(0, 0) * A(1, 1) - A(0, 1) * A(1, 0);
    if (std::abs(det) <= tolerance) {
        return Vec2::Zero();
    }
    double invDet = 1.0 / det;
    return Vec2{
        (A(1, 1) * b[0] - A(0, 1) * b[1]) * invDet,
        (A(0, 0) * b[1] - A(1, 0) * b[0]) * invDet
    };
}

bool IsSolvable2x2(const Mat22& A, double tolerance) {
    double det = A(0, 0) * A(1, 1) - A(0, 1) * A(1, 0);
    return std::abs(det) > tolerance;
}

} // namespace Qi::Conic::Internal
