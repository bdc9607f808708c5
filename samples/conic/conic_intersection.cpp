/**
 * @file conic_intersection.cpp
 * @brief Intersect circle and ellipse pairs and print the pencil diagnostics
 *
 * Usage:
 *   conic_intersection                      built-in scenarios
 *   conic_intersection cx1 cy1 r1 cx2 cy2 r2   two circles
 *
 * Set QICONIC_TRACE=1 to also see every pipeline stage on stderr.
 */

#include <QiConic/QiConic.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace Qi::Conic;

namespace {

void Report(const std::string& title, const Conic2d& a, const Conic2d& b) {
    std::cout << "=== " << title << " ===\n";

    ConicIntersectionResult result;
    try {
        result = IntersectConics(a, b);
    } catch (const Exception& e) {
        std::cout << "Error: " << e.what() << "\n\n";
        return;
    }

    if (result.overlapping) {
        std::cout << "Conics overlap (infinitely many common points)\n\n";
        return;
    }

    std::cout << "Pencil parameters:";
    for (const auto& l : result.lambdas) {
        std::cout << " " << l;
    }
    std::cout << "\n";
    std::cout << "Raw points: " << result.Count() << ", rejected: " << result.rejectedCount << "\n";

    auto unique = result.UniquePoints();
    std::cout << "Intersections (" << unique.size() << "):\n";
    for (const auto& p : unique) {
        std::cout << "  (" << p.x << ", " << p.y << ")"
                  << "  residual " << std::max(NormalizedResidual(a, p), NormalizedResidual(b, p)) << "\n";
    }
    std::cout << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::cout << "QiConic " << GetVersion() << "\n\n";

    if (argc == 7) {
        double v[6];
        for (int i = 0; i < 6; ++i) {
            v[i] = std::atof(argv[i + 1]);
        }
        try {
            Report("Two circles",
                   Conic2d::FromCircle(Circle2d(v[0], v[1], v[2])),
                   Conic2d::FromCircle(Circle2d(v[3], v[4], v[5])));
        } catch (const InvalidArgumentException& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
        return 0;
    }
    if (argc != 1) {
        std::cout << "Usage: " << argv[0] << " [cx1 cy1 r1 cx2 cy2 r2]\n";
        return 1;
    }

    Conic2d unit = Conic2d::FromCircle(Circle2d(0.0, 0.0, 1.0));

    Report("Unit circles one apart", unit, Conic2d::FromCircle(Circle2d(1.0, 0.0, 1.0)));
    Report("Tangent circles", unit, Conic2d::FromCircle(Circle2d(1.5, 0.0, 0.5)));
    Report("Disjoint circles", unit, Conic2d::FromCircle(Circle2d(5.0, 0.0, 1.0)));
    Report("Identical circles", unit, unit);
    Report("Concentric circles", unit, Conic2d::FromCircle(Circle2d(0.0, 0.0, 2.0)));
    Report("Crossed ellipses",
           Conic2d::FromEllipse(Ellipse2d(0.0, 0.0, 2.0, 1.0)),
           Conic2d::FromEllipse(Ellipse2d(0.0, 0.0, 1.0, 2.0)));
    Report("Rotated ellipses",
           Conic2d::FromEllipse(Ellipse2d(1.0, 1.0, 3.0, 1.0, 0.7)),
           Conic2d::FromEllipse(Ellipse2d(-0.5, 0.5, 2.0, 1.5, -0.4)));

    return 0;
}
