/**
 * @file test_solver.cpp
 * @brief Unit tests for Internal/Solver module
 */

#include <QiConic/Internal/Solver.h>
#include <QiConic/Internal/Matrix.h>
#include <gtest/gtest.h>

#include <cmath>
#include <random>

namespace Qi::Conic::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

/// Create a random 2x2 matrix for testing
Mat22 RandomMatrix(std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-10.0, 10.0);
    return Mat22{dist(rng), dist(rng), dist(rng), dist(rng)};
}

// =============================================================================
// Singular Value Tests
// =============================================================================

TEST(SingularValues2x2Test, Diagonal) {
    Vec2 s = SingularValues2x2(Mat22{2.0, 0.0, 0.0, -5.0});
    EXPECT_NEAR(s[0], 5.0, 1e-12);
    EXPECT_NEAR(s[1], 2.0, 1e-12);
}

TEST(SingularValues2x2Test, RankOne) {
    Vec2 s = SingularValues2x2(Mat22{1.0, 2.0, 2.0, 4.0});
    EXPECT_NEAR(s[0], 5.0, 1e-12);
    EXPECT_NEAR(s[1], 0.0, 1e-12);
}

TEST(SingularValues2x2Test, Zero) {
    Vec2 s = SingularValues2x2(Mat22::Zero());
    EXPECT_DOUBLE_EQ(s[0], 0.0);
    EXPECT_DOUBLE_EQ(s[1], 0.0);
}

TEST(SingularValues2x2Test, RandomMatchesInvariants) {
    std::mt19937 rng(12345);
    for (int trial = 0; trial < 200; ++trial) {
        Mat22 A = RandomMatrix(rng);
        Vec2 s = SingularValues2x2(A);

        // s0 * s1 = |det|, s0^2 + s1^2 = Frobenius^2
        double frob2 = A(0, 0) * A(0, 0) + A(0, 1) * A(0, 1) + A(1, 0) * A(1, 0) + A(1, 1) * A(1, 1);
        EXPECT_GE(s[0], s[1]);
        EXPECT_NEAR(s[0] * s[1], std::abs(A.Determinant()), 1e-9);
        EXPECT_NEAR(s[0] * s[0] + s[1] * s[1], frob2, 1e-9);
    }
}

TEST(ComputeRank2x2Test, Ranks) {
    EXPECT_EQ(ComputeRank2x2(Mat22{1.0, 0.0, 0.0, 1.0}), 2);
    EXPECT_EQ(ComputeRank2x2(Mat22{1.0, 2.0, 2.0, 4.0}), 1);
    EXPECT_EQ(ComputeRank2x2(Mat22::Zero()), 0);
    EXPECT_EQ(ComputeRank2x2(Mat22{1.0, 0.0, 0.0, 1e-12}), 1);
}

TEST(ComputeRank2x2Test, DefaultToleranceIsGlobalRankTolerance) {
    EXPECT_DOUBLE_EQ(SOLVER_RANK_TOLERANCE, RANK_TOLERANCE);
    EXPECT_DOUBLE_EQ(SOLVER_SINGULAR_THRESHOLD, EPSILON);

    EXPECT_EQ(ComputeRank2x2(Mat22{1.0, 0.0, 0.0, 0.5 * RANK_TOLERANCE}), 1);
    EXPECT_EQ(ComputeRank2x2(Mat22{1.0, 0.0, 0.0, 2.0 * RANK_TOLERANCE}), 2);
}

// =============================================================================
// Linear System Tests
// =============================================================================

TEST(Solve2x2Test, Regular) {
    Mat22 A{2.0, 1.0, 1.0, 3.0};
    Vec2 x = Solve2x2(A, Vec2{3.0, 5.0});
    EXPECT_NEAR(x[0], 0.8, 1e-12);
    EXPECT_NEAR(x[1], 1.4, 1e-12);
}

TEST(Solve2x2Test, SingularReturnsZero) {
    Mat22 A{1.0, 2.0, 2.0, 4.0};
    EXPECT_FALSE(IsSolvable2x2(A));
    Vec2 x = Solve2x2(A, Vec2{1.0, 1.0});
    EXPECT_DOUBLE_EQ(x[0], 0.0);
    EXPECT_DOUBLE_EQ(x[1], 0.0);
}

TEST(Solve2x2Test, ZeroToleranceSolvesTinyDeterminant) {
    Mat22 A{1e-7, 0.0, 0.0, 1e-7};
    EXPECT_FALSE(IsSolvable2x2(A, 1e-12));
    Vec2 x = Solve2x2(A, Vec2{1e-7, 2e-7}, 0.0);
    EXPECT_NEAR(x[0], 1.0, 1e-9);
    EXPECT_NEAR(x[1], 2.0, 1e-9);
}

TEST(Solve2x2Test, RandomResidual) {
    std::mt19937 rng(7);
    for (int trial = 0; trial < 100; ++trial) {
        Mat22 A = RandomMatrix(rng);
        if (!IsSolvable2x2(A, 1e-3)) continue;
        Vec2 b{1.0, -2.0};
        Vec2 x = Solve2x2(A, b);
        Vec2 r = A * x - b;
        EXPECT_LT(r.Norm(), 1e-9);
    }
}

} // namespace
} // namespace Qi::Conic::Internal
