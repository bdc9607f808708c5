/**
 * @file Matrix.cpp
 * @brief 2D homogeneous transform factories
 */

#include <QiConic/Internal/Matrix.h>

#include <cmath>

namespace Qi::Conic::Internal {

Mat33 Rotation2D(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    return Mat33{
        c, -s, 0.0,
        s,  c, 0.0,
        0.0, 0.0, 1.0
    };
}

Mat33 Translation2D(double tx, double ty) {
    return Mat33{
        1.0, 0.0, tx,
        0.0, 1.0, ty,
        0.0, 0.0, 1.0
    };
}

Mat33 Scaling2D(double sx, double sy) {
    return Mat33{
        sx, 0.0, 0.0,
        0.0, sy, 0.0,
        0.0, 0.0, 1.0
    };
}

} // namespace Qi::Conic::Internal
