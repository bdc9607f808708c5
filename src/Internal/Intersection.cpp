/**
 * @file Intersection.cpp
 * @brief Implementation of complex line intersection
 */

#include <QiConic/Internal/Intersection.h>

#include <cmath>

namespace Qi::Conic::Internal {

std::optional<Point2d> IntersectComplexLines(const ComplexLine& line1, const ComplexLine& line2) {
    const Complex& a1 = line1.a;
    const Complex& b1 = line1.b;
    const Complex& c1 = line1.c;
    const Complex& a2 = line2.a;
    const Complex& b2 = line2.b;
    const Complex& c2 = line2.c;

    Complex det = a2 * b1 - a1 * b2;
    if (det.EqualsEpsilon(Complex::ZERO, LINE_INTERSECTION_TOLERANCE)) {
        return std::nullopt;
    }

    Complex x = (b2 * c1 - b1 * c2) / det;

    // y = (-a x - c) / b on a line that is not vertical
    Complex y;
    if (!b1.EqualsEpsilon(Complex::ZERO, LINE_INTERSECTION_TOLERANCE)) {
        y = (-a1 * x - c1) / b1;
    } else if (!b2.EqualsEpsilon(Complex::ZERO, LINE_INTERSECTION_TOLERANCE)) {
        y = (-a2 * x - c2) / b2;
    } else {
        return std::nullopt;
    }

    if (!x.IsReal(LINE_INTERSECTION_IMAGINARY_TOLERANCE) ||
        !y.IsReal(LINE_INTERSECTION_IMAGINARY_TOLERANCE)) {
        return std::nullopt;
    }
    return Point2d(x.re, y.re);
}

} // namespace Qi::Conic::Internal
