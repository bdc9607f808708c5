/**
 * @file Polynomial.cpp
 * @brief Implementation of closed-form polynomial root solvers
 */

#include <QiConic/Internal/Polynomial.h>

namespace Qi::Conic::Internal {

// =============================================================================
// Linear / Quadratic
// =============================================================================

PolynomialRoots SolveLinear(const Complex& a, const Complex& b) {
    if (a == Complex::ZERO) {
        return b == Complex::ZERO ? PolynomialRoots::All() : PolynomialRoots::None();
    }
    return PolynomialRoots::One(-(b / a));
}

PolynomialRoots SolveQuadratic(const Complex& a, const Complex& b, const Complex& c) {
    if (a == Complex::ZERO) {
        return SolveLinear(b, c);
    }

    Complex denom = Complex::Real(2.0) * a;
    Complex discriminant = (b * b - Complex::Real(4.0) * a * c).Sqrt();

    return PolynomialRoots::Two((discriminant - b) / denom,
                                (-discriminant - b) / denom);
}

// =============================================================================
// Cubic (Cardano)
// =============================================================================

PolynomialRoots SolveCubic(const Complex& a, const Complex& b, const Complex& c, const Complex& d) {
    if (a == Complex::ZERO) {
        return SolveQuadratic(b, c, d);
    }

    Complex denom = -(a * Complex::Real(3.0));
    Complex a2 = a * a;
    Complex b2 = b * b;
    Complex b3 = b2 * b;
    Complex c2 = c * c;
    Complex c3 = c2 * c;
    Complex abc = a * b * c;

    // Delta0 = b^2 - 3ac, Delta1 = 2b^3 - 9abc + 27a^2 d, kept in two halves
    // so the degenerate cases can be detected by exact comparison
    Complex d0First = b2;
    Complex d0Second = a * c * Complex::Real(3.0);
    Complex d1First = b3 * Complex::Real(2.0) + a2 * d * Complex::Real(27.0);
    Complex d1Second = abc * Complex::Real(9.0);

    if (d0First == d0Second && d1First == d1Second) {
        Complex tripleRoot = b / denom;
        return PolynomialRoots::Three(tripleRoot, tripleRoot, tripleRoot);
    }

    Complex delta0 = d0First - d0Second;
    Complex delta1 = d1First - d1Second;

    // Discriminant == 0 (split into the positive and negative terms)
    Complex disc1 = abc * d * Complex::Real(18.0) + b2 * c2;
    Complex disc2 = b3 * d * Complex::Real(4.0) + c3 * a * Complex::Real(4.0) +
                    a2 * d * d * Complex::Real(27.0);
    if (disc1 == disc2) {
        Complex simpleRoot = (abc * Complex::Real(4.0) - (b3 + a2 * d * Complex::Real(9.0))) /
                             (a * delta0);
        Complex doubleRoot = (a * d * Complex::Real(9.0) - b * c) / (delta0 * Complex::Real(2.0));
        return PolynomialRoots::Three(simpleRoot, doubleRoot, doubleRoot);
    }

    Complex cCubed;
    if (d0First == d0Second) {
        cCubed = delta1;
    } else {
        cCubed = (delta1 + (delta1 * delta1 - delta0 * delta0 * delta0 * Complex::Real(4.0)).Sqrt()) /
                 Complex::Real(2.0);
    }

    std::array<Complex, 3> cubeRoots = cCubed.CubeRoots();
    std::array<Complex, 3> roots;
    for (int k = 0; k < 3; ++k) {
        roots[k] = (b + cubeRoots[k] + delta0 / cubeRoots[k]) / denom;
    }
    return PolynomialRoots::Three(roots[0], roots[1], roots[2]);
}

// =============================================================================
// Evaluation
// =============================================================================

Complex EvaluatePolynomial(const Complex* coeffs, int numCoeffs, const Complex& x) {
    // Horner's scheme
    Complex result = Complex::ZERO;
    for (int i = 0; i < numCoeffs; ++i) {
        result = result * x + coeffs[i];
    }
    return result;
}

} // namespace Qi::Conic::Internal
