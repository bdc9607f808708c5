#include <QiConic/Core/Types.h>

namespace Qi::Conic {

// =============================================================================
// Ray2d Implementation
// =============================================================================

Ray2d::Ray2d(const Point2d& o, const Point2d& d) : origin(o) {
    double norm = d.Norm();
    direction = norm > 0.0 ? d * (1.0 / norm) : Point2d(0.0, 0.0);
}

// =============================================================================
// Ellipse2d Implementation
// =============================================================================

Point2d Ellipse2d::PointAt(double theta) const {
    double cosA = std::cos(angle);
    double sinA = std::sin(angle);
    double lx = a * std::cos(theta);
    double ly = b * std::sin(theta);
    return {center.x + lx * cosA - ly * sinA,
            center.y + lx * sinA + ly * cosA};
}

} // namespace Qi::Conic
