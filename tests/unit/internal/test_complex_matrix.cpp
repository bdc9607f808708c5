/**
 * @file test_complex_matrix.cpp
 * @brief Unit tests for Internal/ComplexMatrix module
 */

#include <QiConic/Internal/ComplexMatrix.h>
#include <gtest/gtest.h>

#include <random>

namespace Qi::Conic::Internal {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

void ExpectComplexNear(const Complex& actual, const Complex& expected, double tol = 1e-10) {
    EXPECT_NEAR(actual.re, expected.re, tol);
    EXPECT_NEAR(actual.im, expected.im, tol);
}

Mat33c RandomComplexMatrix(std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-5.0, 5.0);
    Mat33c m;
    for (int i = 0; i < 9; ++i) {
        m[i] = Complex(dist(rng), dist(rng));
    }
    return m;
}

Complex R(double v) { return Complex::Real(v); }

// =============================================================================
// Mat33c Tests
// =============================================================================

class Mat33cTest : public ::testing::Test {
protected:
    Mat33c Sample() const {
        return Mat33c(R(1), R(2), R(3),
                      R(4), R(5), R(6),
                      R(7), R(8), Complex(9, 1));
    }
};

TEST_F(Mat33cTest, DefaultIsZero) {
    Mat33c m;
    EXPECT_EQ(m, Mat33c::Zero());
    EXPECT_DOUBLE_EQ(m.MaxMagnitude(), 0.0);
}

TEST_F(Mat33cTest, ElementAccess) {
    Mat33c m = Sample();
    EXPECT_EQ(m(1, 2), R(6));
    EXPECT_EQ(m[7], R(8));
    EXPECT_EQ(m.m22(), Complex(9, 1));
    EXPECT_EQ(m.m01(), R(2));
}

TEST_F(Mat33cTest, RowsAndColumns) {
    Mat33c m = Sample();
    EXPECT_EQ(m.Row(1), ComplexLine(R(4), R(5), R(6)));
    EXPECT_EQ(m.Col(0), ComplexLine(R(1), R(4), R(7)));
}

TEST_F(Mat33cTest, FromReal) {
    Mat33 real{1, 2, 3, 4, 5, 6, 7, 8, 9};
    Mat33c m = Mat33c::FromReal(real);
    EXPECT_EQ(m(2, 1), R(8));
    EXPECT_EQ(m(0, 0).im, 0.0);
}

TEST_F(Mat33cTest, Arithmetic) {
    Mat33c m = Sample();
    EXPECT_EQ(m - m, Mat33c::Zero());
    EXPECT_EQ((m + m)(2, 2), Complex(18, 2));
    EXPECT_EQ((m * Complex::I)(0, 1), Complex(0, 2));
}

TEST_F(Mat33cTest, MatrixProductWithIdentity) {
    Mat33c identity = Mat33c::FromReal(Mat33::Identity());
    Mat33c m = Sample();
    EXPECT_EQ(m * identity, m);
    EXPECT_EQ(identity * m, m);
}

TEST_F(Mat33cTest, EqualsEpsilon) {
    Mat33c m = Sample();
    Mat33c n = m;
    n(1, 1) = Complex(5.0 + 1e-10, 0.0);
    EXPECT_NE(m, n);
    EXPECT_TRUE(m.EqualsEpsilon(n, 1e-9));
    EXPECT_FALSE(m.EqualsEpsilon(n, 1e-11));
}

TEST_F(Mat33cTest, MaxMagnitude) {
    Mat33c m;
    m(2, 0) = Complex(3, -4);
    m(0, 1) = R(-2);
    EXPECT_DOUBLE_EQ(m.MaxMagnitude(), 5.0);
}

// =============================================================================
// Determinant / Adjugate Tests
// =============================================================================

TEST(ComplexDeterminantTest, RealMatrix) {
    Mat33c m = Mat33c::FromReal(Mat33{1, 2, 3, 0, 1, 4, 5, 6, 0});
    ExpectComplexNear(Determinant(m), R(1.0));
}

TEST(ComplexDeterminantTest, MatchesRealDeterminant) {
    for (const Mat33& real : {Mat33{1, 2, 3, 0, 1, 4, 5, 6, 0},
                              Mat33{2, 0, 1, 1, 3, 2, 1, 1, 1},
                              Mat33{4, -1, 0.5, 2, 7, -3, 1, 1, 9}}) {
        ExpectComplexNear(Determinant(Mat33c::FromReal(real)), R(real.Determinant()));
    }
}

TEST(ComplexDeterminantTest, Diagonal) {
    Mat33c m(Complex::I, R(0), R(0),
             R(0), R(2), R(0),
             R(0), R(0), Complex(1, 1));
    ExpectComplexNear(Determinant(m), Complex(-2.0, 2.0));
}

TEST(ComplexDeterminantTest, TwoByTwo) {
    ExpectComplexNear(Determinant2(R(1), R(2), R(3), R(4)), R(-2));
}

TEST(AdjugateTest, AdjugateTimesMatrixIsDeterminantIdentity) {
    std::mt19937 rng(2024);
    for (int trial = 0; trial < 20; ++trial) {
        Mat33c m = RandomComplexMatrix(rng);
        Complex det = Determinant(m);
        Mat33c p = Adjugate(m) * m;
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                ExpectComplexNear(p(i, j), i == j ? det : Complex::ZERO, 1e-9);
            }
        }
    }
}

TEST(AdjugateTest, RankTwoAdjugateSpansNullSpace) {
    // (x - y)(x + y - 2): lines cross at (1, 1)
    Mat33c m(R(1), R(0), R(-1),
             R(0), R(-1), R(1),
             R(-1), R(1), R(0));
    ExpectComplexNear(Determinant(m), Complex::ZERO);

    ComplexLine r = DominantRow(Adjugate(m), true);
    ExpectComplexNear(r.a, r.c);
    ExpectComplexNear(r.b, r.c);
}

TEST(TransposeTest, Basic) {
    Mat33c m(R(1), R(2), R(3),
             R(4), R(5), R(6),
             R(7), R(8), R(9));
    Mat33c t = Transpose(m);
    EXPECT_EQ(t(0, 2), R(7));
    EXPECT_EQ(t(2, 0), R(3));
    EXPECT_EQ(Transpose(t), m);
}

// =============================================================================
// Dominant Row / Column Tests
// =============================================================================

TEST(DominantRowTest, IgnoresLastEntryByDefault) {
    Mat33c m(R(1), R(1), R(100),
             R(2), R(-2), R(0),
             R(0), R(0), R(0));
    EXPECT_EQ(DominantRow(m), ComplexLine(R(2), R(-2), R(0)));
    EXPECT_EQ(DominantRow(m, true), ComplexLine(R(1), R(1), R(100)));
}

TEST(DominantRowTest, TieGoesToEarliestRow) {
    Mat33c m(R(0), R(0), R(0),
             R(1), R(0), R(5),
             R(0), R(-1), R(7));
    EXPECT_EQ(DominantRow(m), ComplexLine(R(1), R(0), R(5)));
}

TEST(DominantRowTest, UsesMagnitudeOfComplexEntries) {
    Mat33c m(R(1), R(1), R(0),
             Complex(0, 3), R(0), R(0),
             R(0), R(0), R(0));
    EXPECT_EQ(DominantRow(m), ComplexLine(Complex(0, 3), R(0), R(0)));
}

TEST(DominantColumnTest, MatchesTransposedRow) {
    Mat33c m(R(1), R(5), R(0),
             R(2), R(0), R(0),
             R(3), R(1), R(9));
    EXPECT_EQ(DominantColumn(m), ComplexLine(R(5), R(0), R(1)));
    EXPECT_EQ(DominantColumn(m, true), DominantRow(Transpose(m), true));
}

// =============================================================================
// ComplexLine Tests
// =============================================================================

TEST(ComplexLineTest, EvaluateAndIndex) {
    ComplexLine line(R(1), R(-1), R(2));
    EXPECT_EQ(line[0], R(1));
    EXPECT_EQ(line[2], R(2));
    EXPECT_EQ(line.Evaluate(R(3), R(5)), R(0));
    EXPECT_EQ(line.Evaluate(Complex::I, R(0)), Complex(2, 1));
}

} // namespace
} // namespace Qi::Conic::Internal
