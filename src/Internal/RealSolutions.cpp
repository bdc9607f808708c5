/**
 * @file RealSolutions.cpp
 * @brief Implementation of real solution extraction for degenerate conics
 */

#include <QiConic/Internal/RealSolutions.h>
#include <QiConic/Internal/Polynomial.h>
#include <QiConic/Internal/Solver.h>

#include <cmath>

namespace Qi::Conic::Internal {

namespace {

/// Coefficients of A x^2 + B xy + C y^2 + D x + E y + F
struct ConicCoefficients {
    Complex A, B, C, D, E, F;
};

ConicCoefficients ExpandCoefficients(const Mat33c& m) {
    Complex two = Complex::Real(2.0);
    return {m.m00(), m.m01() * two, m.m11(), m.m02() * two, m.m12() * two, m.m22()};
}

/// |z| + |w| of the imaginary components of a basis vector
double ImaginaryWeight(const Vec4& v) {
    return std::abs(v[2]) + std::abs(v[3]);
}

/**
 * @brief Move one complex solution onto the real plane, if possible
 *
 * Components of the 4D vectors are (Re x, Re y, Im x, Im y).
 */
void AppendRealSolution(const ConicCoefficients& k, const ComplexPoint& solution,
                        std::vector<RealSolution>& out) {
    const double rx = solution.x.re;
    const double ry = solution.y.re;
    const double ix = solution.x.im;
    const double iy = solution.y.im;

    const double rA = k.A.re, iA = k.A.im;
    const double rB = k.B.re, iB = k.B.im;
    const double rC = k.C.re, iC = k.C.im;
    const double rD = k.D.re, iD = k.D.im;
    const double rE = k.E.re, iE = k.E.im;

    if (std::abs(ix) < REAL_SOLUTION_RANK_TOLERANCE && std::abs(iy) < REAL_SOLUTION_RANK_TOLERANCE) {
        out.push_back(RealSolution::Point({rx, ry}));
        return;
    }

    // Gradients of Re(Q) and Im(Q) with respect to (rx, ry, ix, iy)
    Vec4 realGradient{
        -2.0 * iA * ix - iB * iy + rD + 2.0 * rA * rx + rB * ry,
        -iB * ix - 2.0 * iC * iy + rE + rB * rx + 2.0 * rC * ry,
        -iD - 2.0 * ix * rA - iy * rB - 2.0 * iA * rx - iB * ry,
        -iE - ix * rB - 2.0 * iy * rC - iB * rx - 2.0 * iC * ry
    };
    Vec4 imaginaryGradient{
        iD + 2.0 * ix * rA + iy * rB + 2.0 * iA * rx + iB * ry,
        iE + ix * rB + 2.0 * iy * rC + iB * rx + 2.0 * iC * ry,
        -2.0 * iA * ix - iB * iy + rD + 2.0 * rA * rx + rB * ry,
        -iB * ix - 2.0 * iC * iy + rE + rB * rx + 2.0 * rC * ry
    };

    // Singular point of the conic (e.g. on a double line): no tangent plane
    if (realGradient.NormSquared() <= REAL_SOLUTION_GRADIENT_EPSILON) {
        return;
    }

    // Gram-Schmidt: the tangent plane is orthogonal to both gradients
    const Vec4& g0 = realGradient;
    Vec4 g1 = imaginaryGradient - Project(imaginaryGradient, g0);
    Vec4 basis0 = CONIC_PROBE_DIRECTION_A - Project(CONIC_PROBE_DIRECTION_A, g0) -
                  Project(CONIC_PROBE_DIRECTION_A, g1);
    Vec4 basis1 = CONIC_PROBE_DIRECTION_B - Project(CONIC_PROBE_DIRECTION_B, g0) -
                  Project(CONIC_PROBE_DIRECTION_B, g1) - Project(CONIC_PROBE_DIRECTION_B, basis0);

    // Imaginary part of the tangent basis, one basis vector per column
    Mat22 imaginaryBasis{
        basis0[2], basis1[2],
        basis0[3], basis1[3]
    };
    Vec2 singular = SingularValues2x2(imaginaryBasis);
    bool rankTwo = std::abs(singular[1]) > REAL_SOLUTION_RANK_TOLERANCE;
    bool rankOne = !rankTwo && std::abs(singular[0]) > REAL_SOLUTION_RANK_TOLERANCE;

    if (rankTwo) {
        // P + t * B0 + u * B1 is real when the imaginary parts cancel:
        // [ B0.z B1.z ] [ t ]   [ -ix ]
        // [ B0.w B1.w ] [ u ] = [ -iy ]
        Vec2 tu = Solve2x2(imaginaryBasis, Vec2{-ix, -iy}, 0.0);
        out.push_back(RealSolution::Point({rx + tu[0] * basis0[0] + tu[1] * basis1[0],
                                           ry + tu[0] * basis0[1] + tu[1] * basis1[1]}));
        return;
    }

    if (!rankOne) {
        // Rank 0 and the solution is not real: no real point in this branch
        return;
    }

    // Rank 1: the imaginary parts of the basis vectors are parallel (one may be zero)
    bool firstLarger = ImaginaryWeight(basis0) > ImaginaryWeight(basis1);
    const Vec4& largest = firstLarger ? basis0 : basis1;
    const Vec4& smallest = firstLarger ? basis1 : basis0;

    Vec2 largestImaginary{largest[2], largest[3]};
    double t = Vec2{ix, iy}.Dot(largestImaginary) / largestImaginary.Dot(largestImaginary);
    Vec4 candidate = Vec4{rx, ry, ix, iy} - largest * t;
    if (std::abs(candidate[2]) >= REAL_SOLUTION_IMAGINARY_TOLERANCE ||
        std::abs(candidate[3]) >= REAL_SOLUTION_IMAGINARY_TOLERANCE) {
        return;
    }

    // largest * s = smallest in the imaginary components; the difference is a
    // purely real direction along which the whole line stays on the conic
    bool zLarger = std::abs(largest[2]) > std::abs(largest[3]);
    double s = zLarger ? smallest[2] / largest[2] : smallest[3] / largest[3];
    Vec4 direction = largest * s - smallest;

    out.push_back(RealSolution::Line({candidate[0], candidate[1]}, {direction[0], direction[1]}));
}

} // anonymous namespace

bool FindComplexSolutions(const Mat33c& m, std::vector<ComplexPoint>& points) {
    points.clear();
    ConicCoefficients k = ExpandCoefficients(m);
    const Complex& alpha = CONIC_PROBE_ALPHA;

    // x = alpha:  C y^2 + (B alpha + E) y + (A alpha^2 + D alpha + F) = 0
    PolynomialRoots xProbe = SolveQuadratic(k.C, k.B * alpha + k.E,
                                            k.A * alpha * alpha + k.D * alpha + k.F);
    if (xProbe.Count() >= 2) {
        points.push_back({alpha, xProbe[0]});
        points.push_back({alpha, xProbe[1]});
        return true;
    }

    // y = alpha:  A x^2 + (B alpha + D) x + (C alpha^2 + E alpha + F) = 0
    PolynomialRoots yProbe = SolveQuadratic(k.A, k.B * alpha + k.D,
                                            k.C * alpha * alpha + k.E * alpha + k.F);
    if (yProbe.Count() >= 2) {
        points.push_back({yProbe[0], alpha});
        points.push_back({yProbe[1], alpha});
        return true;
    }

    // A single root on either axis, e.g. a double line
    if (xProbe.Count() == 1) {
        points.push_back({alpha, xProbe[0]});
        return true;
    }
    if (yProbe.Count() == 1) {
        points.push_back({yProbe[0], alpha});
        return true;
    }
    return false;
}

RealSolutionSet ExtractRealSolutions(const Mat33c& m) {
    RealSolutionSet result;

    std::vector<ComplexPoint> points;
    if (!FindComplexSolutions(m, points)) {
        result.status = RealSolutionStatus::BootstrapFailed;
        return result;
    }

    ConicCoefficients k = ExpandCoefficients(m);
    for (const auto& p : points) {
        AppendRealSolution(k, p, result.solutions);
    }
    return result;
}

} // namespace Qi::Conic::Internal
