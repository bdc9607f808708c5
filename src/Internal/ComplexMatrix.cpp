/**
 * @file ComplexMatrix.cpp
 * @brief Implementation of complex 3x3 matrix helpers
 */

#include <QiConic/Internal/ComplexMatrix.h>

#include <algorithm>

namespace Qi::Conic::Internal {

// =============================================================================
// Mat33c
// =============================================================================

Mat33c Mat33c::FromReal(const Mat33& m) {
    Mat33c result;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            result(i, j) = Complex::Real(m(i, j));
        }
    }
    return result;
}

Mat33c Mat33c::operator+(const Mat33c& m) const {
    Mat33c result;
    for (int i = 0; i < 9; ++i) result.data_[i] = data_[i] + m.data_[i];
    return result;
}

Mat33c Mat33c::operator-(const Mat33c& m) const {
    Mat33c result;
    for (int i = 0; i < 9; ++i) result.data_[i] = data_[i] - m.data_[i];
    return result;
}

Mat33c Mat33c::operator*(const Complex& s) const {
    Mat33c result;
    for (int i = 0; i < 9; ++i) result.data_[i] = data_[i] * s;
    return result;
}

Mat33c Mat33c::operator*(const Mat33c& m) const {
    Mat33c result;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            Complex sum = Complex::ZERO;
            for (int k = 0; k < 3; ++k) {
                sum += (*this)(i, k) * m(k, j);
            }
            result(i, j) = sum;
        }
    }
    return result;
}

bool Mat33c::EqualsEpsilon(const Mat33c& m, double epsilon) const {
    for (int i = 0; i < 9; ++i) {
        if (!data_[i].EqualsEpsilon(m.data_[i], epsilon)) {
            return false;
        }
    }
    return true;
}

double Mat33c::MaxMagnitude() const {
    double maxMag = 0.0;
    for (const auto& e : data_) {
        maxMag = std::max(maxMag, e.Magnitude());
    }
    return maxMag;
}

// =============================================================================
// Determinant / Adjugate / Transpose
// =============================================================================

Complex Determinant(const Mat33c& m) {
    return m.m00() * m.m11() * m.m22() + m.m01() * m.m12() * m.m20() +
           m.m02() * m.m10() * m.m21() - m.m02() * m.m11() * m.m20() -
           m.m01() * m.m10() * m.m22() - m.m00() * m.m12() * m.m21();
}

Mat33c Adjugate(const Mat33c& m) {
    const Complex& a = m.m00(); const Complex& b = m.m01(); const Complex& c = m.m02();
    const Complex& d = m.m10(); const Complex& e = m.m11(); const Complex& f = m.m12();
    const Complex& g = m.m20(); const Complex& h = m.m21(); const Complex& i = m.m22();

    return Mat33c(
         Determinant2(e, f, h, i), -Determinant2(b, c, h, i),  Determinant2(b, c, e, f),
        -Determinant2(d, f, g, i),  Determinant2(a, c, g, i), -Determinant2(a, c, d, f),
         Determinant2(d, e, g, h), -Determinant2(a, b, g, h),  Determinant2(a, b, d, e));
}

Mat33c Transpose(const Mat33c& m) {
    return Mat33c(m.m00(), m.m10(), m.m20(),
                  m.m01(), m.m11(), m.m21(),
                  m.m02(), m.m12(), m.m22());
}

// =============================================================================
// Dominant Row / Column
// =============================================================================

ComplexLine DominantRow(const Mat33c& m, bool checkLast) {
    int best = 0;
    double bestWeight = -1.0;
    for (int i = 0; i < 3; ++i) {
        double weight = m(i, 0).Magnitude() + m(i, 1).Magnitude() +
                        (checkLast ? m(i, 2).Magnitude() : 0.0);
        if (weight > bestWeight) {
            bestWeight = weight;
            best = i;
        }
    }
    return m.Row(best);
}

ComplexLine DominantColumn(const Mat33c& m, bool checkLast) {
    return DominantRow(Transpose(m), checkLast);
}

} // namespace Qi::Conic::Internal
