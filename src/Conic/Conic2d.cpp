/**
 * @file Conic2d.cpp
 * @brief Implementation of the real conic matrix type
 */

#include <QiConic/Conic/Conic2d.h>
#include <QiConic/Core/Validate.h>

#include <cmath>

namespace Qi::Conic {

Conic2d::Conic2d(double m00, double m01, double m02,
                 double m10, double m11, double m12,
                 double m20, double m21, double m22)
    : data_{m00, m01, m02, m10, m11, m12, m20, m21, m22} {}

// =============================================================================
// Factory Methods
// =============================================================================

Conic2d Conic2d::FromCoefficients(double A, double B, double C, double D, double E, double F) {
    return Conic2d(A,       B / 2.0, D / 2.0,
                   B / 2.0, C,       E / 2.0,
                   D / 2.0, E / 2.0, F);
}

Conic2d Conic2d::FromMatrix(const Internal::Mat33& m) {
    return Conic2d(m(0, 0), m(0, 1), m(0, 2),
                   m(1, 0), m(1, 1), m(1, 2),
                   m(2, 0), m(2, 1), m(2, 2));
}

Conic2d Conic2d::FromCircle(const Circle2d& circle) {
    Validate::RequireValid(circle, "circle", "Conic2d::FromCircle");

    // (x - a)^2 + (y - b)^2 = r^2
    double a = circle.center.x;
    double b = circle.center.y;
    double r = circle.radius;
    return FromCoefficients(1.0, 0.0, 1.0, -2.0 * a, -2.0 * b, a * a + b * b - r * r);
}

Conic2d Conic2d::FromEllipse(const Ellipse2d& ellipse) {
    Validate::RequireValid(ellipse, "ellipse", "Conic2d::FromEllipse");
    Validate::RequirePositive(ellipse.a, "ellipse.a", "Conic2d::FromEllipse");
    Validate::RequirePositive(ellipse.b, "ellipse.b", "Conic2d::FromEllipse");

    // (x, y, 1) = U (x', y', 1) maps the unit circle x'^2 + y'^2 = 1 onto the ellipse
    Internal::Mat33 unit = Internal::Translation2D(ellipse.center.x, ellipse.center.y) *
                           Internal::Rotation2D(ellipse.angle) *
                           Internal::Scaling2D(ellipse.a, ellipse.b);
    Internal::Mat33 unitCircle{
        1.0, 0.0, 0.0,
        0.0, 1.0, 0.0,
        0.0, 0.0, -1.0
    };
    Internal::Mat33 inverse = unit.Inverse();
    return FromMatrix(inverse.Transpose() * unitCircle * inverse);
}

// =============================================================================
// Accessors / Properties
// =============================================================================

Internal::Mat33 Conic2d::ToMatrix() const {
    return Internal::Mat33{
        data_[0], data_[1], data_[2],
        data_[3], data_[4], data_[5],
        data_[6], data_[7], data_[8]
    };
}

double Conic2d::Evaluate(const Point2d& p) const {
    Internal::Vec3 v{p.x, p.y, 1.0};
    return v.Dot(ToMatrix() * v);
}

double Conic2d::Determinant() const {
    return ToMatrix().Determinant();
}

bool Conic2d::IsValid() const {
    for (double v : data_) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return true;
}

bool Conic2d::operator==(const Conic2d& other) const {
    for (int i = 0; i < 9; ++i) {
        if (data_[i] != other.data_[i]) {
            return false;
        }
    }
    return true;
}

} // namespace Qi::Conic
