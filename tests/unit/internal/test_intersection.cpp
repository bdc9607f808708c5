/**
 * @file test_intersection.cpp
 * @brief Unit tests for Internal/Intersection module
 */

#include <QiConic/Internal/Intersection.h>
#include <QiConic/Core/Types.h>
#include <gtest/gtest.h>

#include <cmath>

namespace Qi::Conic::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

Complex R(double v) { return Complex::Real(v); }

bool NearEqual(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) < tol;
}

bool PointNearEqual(const Point2d& a, const Point2d& b, double tol = 1e-9) {
    return NearEqual(a.x, b.x, tol) && NearEqual(a.y, b.y, tol);
}

// =============================================================================
// Complex Line-Line Intersection Tests
// =============================================================================

class ComplexLineIntersectionTest : public ::testing::Test {};

TEST_F(ComplexLineIntersectionTest, PerpendicularLines) {
    // y = 0 and x = 0
    ComplexLine line1(R(0), R(1), R(0));
    ComplexLine line2(R(1), R(0), R(0));

    auto result = IntersectComplexLines(line1, line2);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(PointNearEqual(*result, {0.0, 0.0}));
}

TEST_F(ComplexLineIntersectionTest, DiagonalLines) {
    // x - y = 0 and x + y - 2 = 0 cross at (1, 1)
    auto result = IntersectComplexLines({R(1), R(-1), R(0)}, {R(1), R(1), R(-2)});

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(PointNearEqual(*result, {1.0, 1.0}));
}

TEST_F(ComplexLineIntersectionTest, VerticalFirstLineUsesSecondForY) {
    // x = 3 and y = 2x - 1
    auto result = IntersectComplexLines({R(1), R(0), R(-3)}, {R(2), R(-1), R(-1)});

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(PointNearEqual(*result, {3.0, 5.0}));
}

TEST_F(ComplexLineIntersectionTest, ParallelLines) {
    auto result = IntersectComplexLines({R(1), R(1), R(0)}, {R(2), R(2), R(5)});
    EXPECT_FALSE(result.has_value());
}

TEST_F(ComplexLineIntersectionTest, NearlyParallelBelowTolerance) {
    auto result = IntersectComplexLines({R(1), R(1), R(0)}, {R(1), R(1.0 + 1e-10), R(1)});
    EXPECT_FALSE(result.has_value());
}

TEST_F(ComplexLineIntersectionTest, ConjugateLinesCrossAtRealPoint) {
    // x + i y - (2 + 3i) = 0 and x - i y - (2 - 3i) = 0 cross at (2, 3)
    ComplexLine line1(R(1), Complex::I, Complex(-2, -3));
    ComplexLine line2(R(1), -Complex::I, Complex(-2, 3));

    auto result = IntersectComplexLines(line1, line2);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(PointNearEqual(*result, {2.0, 3.0}));
}

TEST_F(ComplexLineIntersectionTest, ComplexCrossingIsNoIntersection) {
    // y = 0 and x + i = 0 cross at (-i, 0)
    auto result = IntersectComplexLines({R(0), R(1), R(0)}, {R(1), R(0), Complex::I});
    EXPECT_FALSE(result.has_value());
}

TEST_F(ComplexLineIntersectionTest, ScaledLinesGiveSamePoint) {
    ComplexLine line1(R(1), R(-1), R(0));
    ComplexLine line2(R(1), R(1), R(-2));
    Complex s(0.3, -2.0);
    ComplexLine scaled(line2.a * s, line2.b * s, line2.c * s);

    auto result = IntersectComplexLines(line1, scaled);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(PointNearEqual(*result, {1.0, 1.0}));
}

TEST_F(ComplexLineIntersectionTest, ImaginaryPartBelowRealToleranceIsAccepted) {
    EXPECT_DOUBLE_EQ(LINE_INTERSECTION_IMAGINARY_TOLERANCE, REAL_TOLERANCE);

    // y = 0 and x - (1 + d i) = 0 cross at x = 1 + d i
    Complex small(0.0, 0.5 * REAL_TOLERANCE);
    auto kept = IntersectComplexLines({R(0), R(1), R(0)}, {R(1), R(0), R(-1) - small});
    ASSERT_TRUE(kept.has_value());
    EXPECT_TRUE(PointNearEqual(*kept, {1.0, 0.0}));

    Complex large(0.0, 2.0 * REAL_TOLERANCE);
    auto dropped = IntersectComplexLines({R(0), R(1), R(0)}, {R(1), R(0), R(-1) - large});
    EXPECT_FALSE(dropped.has_value());
}

} // namespace
} // namespace Qi::Conic::Internal
