/**
 * @file DegenerateConic.cpp
 * @brief Implementation of degenerate conic decomposition
 */

#include <QiConic/Internal/DegenerateConic.h>
#include <QiConic/Internal/Polynomial.h>

namespace Qi::Conic::Internal {

Mat33c AntiSymmetricMatrix(const Mat33c& m) {
    // Rows of the adjugate are all multiples of the crossing point; the third
    // entry counts so a crossing at the origin (0, 0, 1) is not lost
    ComplexLine r = DominantRow(Adjugate(m), true);
    return Mat33c(Complex::ZERO, r.c,           -r.b,
                  -r.c,          Complex::ZERO, r.a,
                  r.b,           -r.a,          Complex::ZERO);
}

namespace {

/// Minors tried in order; (0,1) degenerates when the crossing point is at infinity
constexpr int RANK_ONE_MINORS[3][2] = {{0, 1}, {0, 2}, {1, 2}};

} // anonymous namespace

PolynomialRoots RankOneCorrectionRoots(const Mat33c& m, const Mat33c& s, int i, int j) {
    // Minor (i, j) of m + t s:
    //   (m_ij + t s_ij)(m_ji + t s_ji) - (m_ii + t s_ii)(m_jj + t s_jj) = 0
    const Complex& dii = m(i, i);
    const Complex& dij = m(i, j);
    const Complex& dji = m(j, i);
    const Complex& djj = m(j, j);
    const Complex& aii = s(i, i);
    const Complex& aij = s(i, j);
    const Complex& aji = s(j, i);
    const Complex& ajj = s(j, j);

    Complex qa = aij * aji - aii * ajj;
    Complex qb = -ajj * dii + aji * dij + aij * dji - aii * djj;
    Complex qc = dij * dji - dii * djj;
    return SolveQuadratic(qa, qb, qc);
}

std::optional<Complex> ComputeRankOneCorrection(const Mat33c& m, const Mat33c& s) {
    for (const auto& minor : RANK_ONE_MINORS) {
        PolynomialRoots roots = RankOneCorrectionRoots(m, s, minor[0], minor[1]);
        if (roots.HasRoots()) {
            return roots[0];
        }
    }
    return std::nullopt;
}

Mat33c ToRankOne(const Mat33c& m) {
    Mat33c s = AntiSymmetricMatrix(m);
    std::optional<Complex> t = ComputeRankOneCorrection(m, s);
    if (!t) {
        return m;
    }
    return m + s * *t;
}

LinePair DecomposeDegenerateConic(const Mat33c& m) {
    Mat33c rankOne = ToRankOne(m);
    return {DominantRow(rankOne), DominantColumn(rankOne)};
}

Mat33c ComposeLinePair(const ComplexLine& l1, const ComplexLine& l2) {
    Mat33c result;
    Complex half = Complex::Real(0.5);
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            result(i, j) = (l1[i] * l2[j] + l2[i] * l1[j]) * half;
        }
    }
    return result;
}

} // namespace Qi::Conic::Internal
