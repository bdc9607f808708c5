#pragma once

/**
 * @file ComplexMatrix.h
 * @brief Complex 3x3 matrices and homogeneous lines for conic algebra
 *
 * This module provides:
 * - Mat33c: fixed-size row-major 3x3 complex matrix (conic matrix)
 * - ComplexLine: homogeneous line a*x + b*y + c = 0 with complex coefficients
 * - Determinant, adjugate, transpose
 * - Dominant row/column selection (representative line of a rank-1 matrix)
 *
 * Used by:
 * - DegenerateConic.h (rank-1 correction and line pair extraction)
 * - RealSolutions.h (real points of a pencil member)
 * - Conic/ConicIntersection.h (pencil construction)
 *
 * Conic matrix convention for A x^2 + B xy + C y^2 + D x + E y + F = 0:
 *
 *   [ A    B/2  D/2 ]
 *   [ B/2  C    E/2 ]
 *   [ D/2  E/2  F   ]
 */

#include <QiConic/Core/Complex.h>
#include <QiConic/Internal/Matrix.h>

#include <array>

namespace Qi::Conic::Internal {

// =============================================================================
// ComplexLine
// =============================================================================

/**
 * @brief Homogeneous line a*x + b*y + c = 0, complex coefficients allowed
 */
struct ComplexLine {
    Complex a;
    Complex b;
    Complex c;

    ComplexLine() = default;
    ComplexLine(const Complex& a_, const Complex& b_, const Complex& c_) : a(a_), b(b_), c(c_) {}

    const Complex& operator[](int i) const { return i == 0 ? a : (i == 1 ? b : c); }

    /// a*x + b*y + c
    Complex Evaluate(const Complex& x, const Complex& y) const {
        return a * x + b * y + c;
    }

    bool operator==(const ComplexLine& other) const {
        return a == other.a && b == other.b && c == other.c;
    }
};

/**
 * @brief The two lines a degenerate conic factors into
 */
struct LinePair {
    ComplexLine first;
    ComplexLine second;
};

// =============================================================================
// Mat33c
// =============================================================================

/**
 * @brief Row-major 3x3 complex matrix, stack allocated
 */
class Mat33c {
public:
    /// Zero matrix
    Mat33c() = default;

    /// Construct from 9 row-major entries
    Mat33c(const Complex& e00, const Complex& e01, const Complex& e02,
           const Complex& e10, const Complex& e11, const Complex& e12,
           const Complex& e20, const Complex& e21, const Complex& e22)
        : data_{e00, e01, e02, e10, e11, e12, e20, e21, e22} {}

    /// Promote a real matrix (zero imaginary parts)
    static Mat33c FromReal(const Mat33& m);

    static Mat33c Zero() { return Mat33c(); }

    // =========================================================================
    // Element Access
    // =========================================================================

    Complex& operator()(int row, int col) { return data_[row * 3 + col]; }
    const Complex& operator()(int row, int col) const { return data_[row * 3 + col]; }

    /// Row-major flat index 0..8
    Complex& operator[](int i) { return data_[i]; }
    const Complex& operator[](int i) const { return data_[i]; }

    const Complex& m00() const { return data_[0]; }
    const Complex& m01() const { return data_[1]; }
    const Complex& m02() const { return data_[2]; }
    const Complex& m10() const { return data_[3]; }
    const Complex& m11() const { return data_[4]; }
    const Complex& m12() const { return data_[5]; }
    const Complex& m20() const { return data_[6]; }
    const Complex& m21() const { return data_[7]; }
    const Complex& m22() const { return data_[8]; }

    ComplexLine Row(int i) const {
        return {data_[i * 3], data_[i * 3 + 1], data_[i * 3 + 2]};
    }

    ComplexLine Col(int j) const {
        return {data_[j], data_[3 + j], data_[6 + j]};
    }

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Mat33c operator+(const Mat33c& m) const;
    Mat33c operator-(const Mat33c& m) const;
    Mat33c operator*(const Complex& s) const;

    /// Matrix product
    Mat33c operator*(const Mat33c& m) const;

    bool operator==(const Mat33c& m) const { return data_ == m.data_; }
    bool operator!=(const Mat33c& m) const { return !(*this == m); }

    /// Every entry within epsilon (max component difference)
    bool EqualsEpsilon(const Mat33c& m, double epsilon) const;

    /// Max entry magnitude
    double MaxMagnitude() const;

private:
    std::array<Complex, 9> data_;
};

// =============================================================================
// Matrix Helpers
// =============================================================================

/// Determinant of the 2x2 matrix [a b; c d]
inline Complex Determinant2(const Complex& a, const Complex& b, const Complex& c, const Complex& d) {
    return a * d - b * c;
}

/// Determinant by cofactor expansion
Complex Determinant(const Mat33c& m);

/**
 * @brief Adjugate (transpose of the cofactor matrix)
 * adj(M) * M = det(M) * I. For a rank-2 matrix every nonzero row of the
 * adjugate spans the null space direction.
 */
Mat33c Adjugate(const Mat33c& m);

/// Plain transpose (no conjugation)
Mat33c Transpose(const Mat33c& m);

/**
 * @brief Row with the largest |e0| + |e1| (+ |e2| when checkLast)
 *
 * With checkLast=false, rows that only have a nonzero third entry are never
 * preferred, so the selected row is a proper line when one exists. Ties go to
 * the earliest row.
 */
ComplexLine DominantRow(const Mat33c& m, bool checkLast = false);

/**
 * @brief Column with the largest |e0| + |e1| (+ |e2| when checkLast)
 * Equivalent to DominantRow(Transpose(m), checkLast).
 */
ComplexLine DominantColumn(const Mat33c& m, bool checkLast = false);

} // namespace Qi::Conic::Internal
