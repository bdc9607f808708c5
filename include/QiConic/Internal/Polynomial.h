#pragma once

/**
 * @file Polynomial.h
 * @brief Closed-form polynomial root solvers with complex coefficients
 *
 * This module provides:
 * - Linear, quadratic and cubic root solving (Cardano) over complex numbers
 * - Tagged result type distinguishing "no roots", "every value is a root"
 *   and an explicit root list
 *
 * Used by:
 * - Internal/DegenerateConic.h (rank-1 correction parameter)
 * - Internal/RealSolutions.h (probe-axis quadratics)
 * - Conic/ConicIntersection.h (pencil parameter cubic)
 *
 * Design principles:
 * - Complex arithmetic throughout, since discriminants go negative even for
 *   real coefficients
 * - Degree reduction when the leading coefficient is exactly zero
 * - Repeated roots are reported once per multiplicity
 * - No heap allocation (at most 3 roots)
 */

#include <QiConic/Core/Complex.h>

#include <array>

namespace Qi::Conic::Internal {

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Classification of a root-solving result
 */
enum class RootsKind {
    NoRoots,    ///< Equation has no solution (e.g. 0x + 1 = 0)
    AllRoots,   ///< Every value is a solution (0x + 0 = 0)
    Roots       ///< Finite list of roots in `roots`
};

/**
 * @brief Roots of a polynomial of degree <= 3
 */
struct PolynomialRoots {
    RootsKind kind = RootsKind::NoRoots;
    std::array<Complex, 3> roots;   ///< Valid entries: [0, count)
    int count = 0;

    /// Number of listed roots (0 for NoRoots and AllRoots)
    int Count() const { return count; }

    bool HasRoots() const { return kind == RootsKind::Roots && count > 0; }

    bool IsNoRoots() const { return kind == RootsKind::NoRoots; }
    bool IsAllRoots() const { return kind == RootsKind::AllRoots; }

    const Complex& operator[](int i) const { return roots[i]; }

    const Complex* begin() const { return roots.data(); }
    const Complex* end() const { return roots.data() + count; }

    static PolynomialRoots None() { return PolynomialRoots{}; }

    static PolynomialRoots All() {
        PolynomialRoots r;
        r.kind = RootsKind::AllRoots;
        return r;
    }

    static PolynomialRoots One(const Complex& r0) {
        PolynomialRoots r;
        r.kind = RootsKind::Roots;
        r.roots[0] = r0;
        r.count = 1;
        return r;
    }

    static PolynomialRoots Two(const Complex& r0, const Complex& r1) {
        PolynomialRoots r = One(r0);
        r.roots[1] = r1;
        r.count = 2;
        return r;
    }

    static PolynomialRoots Three(const Complex& r0, const Complex& r1, const Complex& r2) {
        PolynomialRoots r = Two(r0, r1);
        r.roots[2] = r2;
        r.count = 3;
        return r;
    }
};

// =============================================================================
// Root Solvers
// =============================================================================

/**
 * @brief Solve a*x + b = 0
 *
 * @return NoRoots if a == 0 and b != 0, AllRoots if a == b == 0,
 *         otherwise the single root -b/a
 */
PolynomialRoots SolveLinear(const Complex& a, const Complex& b);

/**
 * @brief Solve a*x^2 + b*x + c = 0
 *
 * Reduces to SolveLinear(b, c) when a is exactly zero. Otherwise always
 * returns two roots, ((sqrt(disc) - b) / 2a, (-sqrt(disc) - b) / 2a), with
 * the principal complex square root of the discriminant.
 */
PolynomialRoots SolveQuadratic(const Complex& a, const Complex& b, const Complex& c);

/**
 * @brief Solve a*x^3 + b*x^2 + c*x + d = 0 (Cardano's method)
 *
 * Reduces to SolveQuadratic(b, c, d) when a is exactly zero. Exact triple
 * roots and exact double roots are detected and returned with multiplicity;
 * otherwise the three roots are derived from the three cube roots of
 * C^3 = (Delta1 + sqrt(Delta1^2 - 4 Delta0^3)) / 2.
 */
PolynomialRoots SolveCubic(const Complex& a, const Complex& b, const Complex& c, const Complex& d);

/**
 * @brief Evaluate a polynomial given by coefficients (highest degree first)
 */
Complex EvaluatePolynomial(const Complex* coeffs, int numCoeffs, const Complex& x);

} // namespace Qi::Conic::Internal
