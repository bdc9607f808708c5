#pragma once

/**
 * @file Conic2d.h
 * @brief Real conic section in symmetric 3x3 matrix form
 *
 * Q(x, y) = A x^2 + B xy + C y^2 + D x + E y + F = 0 is stored as
 *
 *   [ A    B/2  D/2 ]
 *   [ B/2  C    E/2 ]
 *   [ D/2  E/2  F   ]
 *
 * so that Q(x, y) = [x y 1] M [x y 1]^T.
 */

#include <QiConic/Core/Export.h>
#include <QiConic/Core/Types.h>
#include <QiConic/Internal/Matrix.h>

namespace Qi::Conic {

/**
 * @brief Real conic matrix, row-major
 */
class QICONIC_API Conic2d {
public:
    /// Zero matrix
    Conic2d() = default;

    /// Construct from 9 row-major matrix entries
    Conic2d(double m00, double m01, double m02,
            double m10, double m11, double m12,
            double m20, double m21, double m22);

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Conic of A x^2 + B xy + C y^2 + D x + E y + F = 0
    static Conic2d FromCoefficients(double A, double B, double C, double D, double E, double F);

    /// Conic from a 3x3 matrix (taken as-is, not symmetrized)
    static Conic2d FromMatrix(const Internal::Mat33& m);

    /**
     * @brief Conic of a circle: x^2 + y^2 - 2 cx x - 2 cy y + (cx^2 + cy^2 - r^2) = 0
     * @throws InvalidArgumentException if the circle is not finite or r < 0
     */
    static Conic2d FromCircle(const Circle2d& circle);

    /**
     * @brief Conic of a (rotated) ellipse
     *
     * With U = T(center) R(angle) S(a, b) mapping the unit circle onto the
     * ellipse, the conic is U^-T diag(1, 1, -1) U^-1.
     *
     * @throws InvalidArgumentException if the ellipse is not finite or a semi-axis is not > 0
     */
    static Conic2d FromEllipse(const Ellipse2d& ellipse);

    // =========================================================================
    // Element Access
    // =========================================================================

    double operator()(int row, int col) const { return data_[row * 3 + col]; }

    double m00() const { return data_[0]; }
    double m01() const { return data_[1]; }
    double m02() const { return data_[2]; }
    double m10() const { return data_[3]; }
    double m11() const { return data_[4]; }
    double m12() const { return data_[5]; }
    double m20() const { return data_[6]; }
    double m21() const { return data_[7]; }
    double m22() const { return data_[8]; }

    Internal::Mat33 ToMatrix() const;

    // =========================================================================
    // Properties
    // =========================================================================

    /// Q(x, y); zero on the curve
    double Evaluate(const Point2d& p) const;

    double Determinant() const;

    /// All entries finite
    bool IsValid() const;

    bool operator==(const Conic2d& other) const;
    bool operator!=(const Conic2d& other) const { return !(*this == other); }

private:
    double data_[9] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
};

} // namespace Qi::Conic
