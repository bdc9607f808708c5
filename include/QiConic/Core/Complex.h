#pragma once

/**
 * @file Complex.h
 * @brief Complex number value type for QiConic
 *
 * This module provides:
 * - Complex arithmetic (add, subtract, multiply, divide, negate, conjugate)
 * - Magnitude, argument, principal square root, exponential, cube roots
 * - Exact and epsilon equality
 *
 * Used by:
 * - Internal/Polynomial.h (closed-form root solvers)
 * - Internal/ComplexMatrix.h (complex 3x3 conic matrices)
 * - Conic/ConicIntersection.h (pencil of conics)
 *
 * Design principles:
 * - Plain value type, all operations return new values
 * - Double precision only
 */

#include <QiConic/Core/Export.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iosfwd>

namespace Qi::Conic {

/**
 * @brief Complex number re + im * i
 */
struct QICONIC_API Complex {
    double re = 0.0;    ///< Real part
    double im = 0.0;    ///< Imaginary part

    Complex() = default;
    Complex(double re_, double im_) : re(re_), im(im_) {}

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Complex number with zero imaginary part
    static Complex Real(double value) { return {value, 0.0}; }

    /// Complex number with zero real part
    static Complex Imaginary(double value) { return {0.0, value}; }

    /// Complex number from polar form: magnitude * (cos(phase) + i sin(phase))
    static Complex Polar(double magnitude, double phase);

    static const Complex ZERO;
    static const Complex ONE;
    static const Complex I;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Complex operator+(const Complex& c) const { return {re + c.re, im + c.im}; }
    Complex operator-(const Complex& c) const { return {re - c.re, im - c.im}; }

    Complex operator*(const Complex& c) const {
        return {re * c.re - im * c.im, re * c.im + im * c.re};
    }

    Complex operator/(const Complex& c) const;

    Complex operator*(double s) const { return {re * s, im * s}; }

    Complex operator-() const { return {-re, -im}; }

    Complex& operator+=(const Complex& c) { return *this = *this + c; }
    Complex& operator-=(const Complex& c) { return *this = *this - c; }
    Complex& operator*=(const Complex& c) { return *this = *this * c; }
    Complex& operator/=(const Complex& c) { return *this = *this / c; }

    /// Complex conjugate
    Complex Conjugated() const { return {re, -im}; }

    /// z * z
    Complex Squared() const { return *this * *this; }

    // =========================================================================
    // Properties
    // =========================================================================

    /// Euclidean norm sqrt(re^2 + im^2)
    double Magnitude() const { return std::sqrt(MagnitudeSquared()); }

    double MagnitudeSquared() const { return re * re + im * im; }

    /// Argument (phase) in (-pi, pi]
    double Argument() const { return std::atan2(im, re); }

    double Phase() const { return Argument(); }

    /// True if the imaginary part is within tolerance of zero
    bool IsReal(double tolerance) const { return std::abs(im) < tolerance; }

    bool IsFinite() const { return std::isfinite(re) && std::isfinite(im); }

    // =========================================================================
    // Functions
    // =========================================================================

    /**
     * @brief Principal square root by the half-angle formula
     *
     * The imaginary sign follows the input, with a zero imaginary part taken as
     * positive, so sqrt(-4) = 2i.
     */
    Complex Sqrt() const;

    /// e^(re + i im) = e^re (cos im + i sin im)
    Complex Exponentiated() const;

    /**
     * @brief The three cube roots
     * @return {principal, principal rotated by +2pi/3, principal rotated by -2pi/3}
     */
    std::array<Complex, 3> CubeRoots() const;

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Exact component-wise equality
    bool operator==(const Complex& c) const { return re == c.re && im == c.im; }
    bool operator!=(const Complex& c) const { return !(*this == c); }

    /// Maximum component difference is at most epsilon
    bool EqualsEpsilon(const Complex& c, double epsilon = 0.0) const {
        return std::max(std::abs(re - c.re), std::abs(im - c.im)) <= epsilon;
    }
};

inline const Complex Complex::ZERO{0.0, 0.0};
inline const Complex Complex::ONE{1.0, 0.0};
inline const Complex Complex::I{0.0, 1.0};

inline Complex operator*(double s, const Complex& c) {
    return c * s;
}

/// Prints "Complex(re, im)"
QICONIC_API std::ostream& operator<<(std::ostream& os, const Complex& c);

} // namespace Qi::Conic
