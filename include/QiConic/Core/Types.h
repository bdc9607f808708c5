#pragma once

/**
 * @file Types.h
 * @brief Core geometric type definitions for QiConic
 */

#include <QiConic/Core/Export.h>

#include <cmath>

namespace Qi::Conic {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with double precision
 */
struct QICONIC_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point2d& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Ray2d
// =============================================================================

/**
 * @brief Half-infinite 2D ray: origin + t * direction, t >= 0
 * @note Direction is normalized on construction (zero stays zero)
 */
struct QICONIC_API Ray2d {
    Point2d origin;
    Point2d direction;

    Ray2d() = default;
    Ray2d(const Point2d& o, const Point2d& d);

    /// Point at parameter t along the ray
    Point2d PointAt(double t) const {
        return origin + direction * t;
    }

    bool IsValid() const {
        return origin.IsValid() && direction.IsValid() && direction.Norm() > 0.0;
    }
};

// =============================================================================
// Circle2d
// =============================================================================

/**
 * @brief 2D circle
 */
struct QICONIC_API Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}
    Circle2d(double cx, double cy, double r) : center(cx, cy), radius(r) {}

    /// Point on circle at angle theta (radians)
    Point2d PointAt(double theta) const {
        return {center.x + radius * std::cos(theta), center.y + radius * std::sin(theta)};
    }

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) && radius >= 0.0;
    }
};

// =============================================================================
// Ellipse2d
// =============================================================================

/**
 * @brief 2D ellipse
 */
struct QICONIC_API Ellipse2d {
    Point2d center;
    double a = 0.0;        ///< Semi-axis along the rotated x direction
    double b = 0.0;        ///< Semi-axis along the rotated y direction
    double angle = 0.0;    ///< Rotation angle (radians)

    Ellipse2d() = default;
    Ellipse2d(const Point2d& c, double semiMajor, double semiMinor, double phi = 0.0)
        : center(c), a(semiMajor), b(semiMinor), angle(phi) {}
    Ellipse2d(double cx, double cy, double semiMajor, double semiMinor, double phi = 0.0)
        : center(cx, cy), a(semiMajor), b(semiMinor), angle(phi) {}

    /// Get point on ellipse at angle theta (in ellipse local coordinates)
    Point2d PointAt(double theta) const;

    bool IsValid() const {
        return center.IsValid() && std::isfinite(a) && std::isfinite(b) &&
               std::isfinite(angle) && a >= 0.0 && b >= 0.0;
    }
};

} // namespace Qi::Conic
