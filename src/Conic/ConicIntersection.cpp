/**
 * @file ConicIntersection.cpp
 * @brief Implementation of conic-conic intersection
 */

#include <QiConic/Conic/ConicIntersection.h>
#include <QiConic/Core/Exception.h>
#include <QiConic/Core/Validate.h>
#include <QiConic/Internal/DegenerateConic.h>
#include <QiConic/Internal/Intersection.h>
#include <QiConic/Internal/Polynomial.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <string>

namespace Qi::Conic {

namespace {

/// Pencil member counts as zero below this fraction of the input scale
constexpr double PENCIL_MEMBER_ZERO_TOLERANCE = 1e-10;

double MaxAbsEntry(const Conic2d& c) {
    double maxAbs = 0.0;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            maxAbs = std::max(maxAbs, std::abs(c(i, j)));
        }
    }
    return maxAbs;
}

std::string FormatPoint(const Point2d& p) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "(%.10g, %.10g)", p.x, p.y);
    return buf;
}

std::string FormatLine(const Internal::ComplexLine& line) {
    std::ostringstream oss;
    oss << "[" << line.a << ", " << line.b << ", " << line.c << "]";
    return oss.str();
}

std::string FormatSolutions(const std::vector<Internal::RealSolution>& solutions) {
    if (solutions.empty()) {
        return "none";
    }
    std::string text;
    for (const auto& s : solutions) {
        if (!text.empty()) {
            text += " ";
        }
        text += FormatPoint(s.point);
        if (s.IsRay()) {
            text += " dir " + FormatPoint(s.direction);
        }
    }
    return text;
}

/// l * a + b as a complex matrix
Internal::Mat33c PencilMember(const Complex& lambda, const Internal::Mat33c& a, const Internal::Mat33c& b) {
    return a * lambda + b;
}

} // anonymous namespace

// =============================================================================
// ConicIntersectionResult
// =============================================================================

std::vector<Point2d> ConicIntersectionResult::UniquePoints(double tolerance) const {
    std::vector<Point2d> unique;
    for (const auto& p : points) {
        bool seen = std::any_of(unique.begin(), unique.end(), [&](const Point2d& q) {
            return p.DistanceTo(q) <= tolerance;
        });
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

// =============================================================================
// Helpers
// =============================================================================

std::array<double, 4> PencilCubicCoefficients(const Conic2d& a, const Conic2d& b) {
    const double a00 = a.m00(), a01 = a.m01(), a02 = a.m02();
    const double a10 = a.m10(), a11 = a.m11(), a12 = a.m12();
    const double a20 = a.m20(), a21 = a.m21(), a22 = a.m22();
    const double b00 = b.m00(), b01 = b.m01(), b02 = b.m02();
    const double b10 = b.m10(), b11 = b.m11(), b12 = b.m12();
    const double b20 = b.m20(), b21 = b.m21(), b22 = b.m22();

    // Expansion of det(l * a + b), grouped by powers of l
    double cubic = -a02 * a11 * a20 + a01 * a12 * a20 + a02 * a10 * a21 -
                   a00 * a12 * a21 - a01 * a10 * a22 + a00 * a11 * a22;

    double quadratic = -a10 * a22 * b01 + a10 * a21 * b02 + a02 * a21 * b10 -
                       a01 * a22 * b10 - a02 * a20 * b11 + a00 * a22 * b11 +
                       a01 * a20 * b12 - a00 * a21 * b12 + a02 * a10 * b21 +
                       a12 * (-a21 * b00 + a20 * b01 + a01 * b20 - a00 * b21) -
                       a01 * a10 * b22 +
                       a11 * (a22 * b00 - a20 * b02 - a02 * b20 + a00 * b22);

    double linear = -a22 * b01 * b10 + a21 * b02 * b10 + a22 * b00 * b11 -
                    a20 * b02 * b11 - a21 * b00 * b12 + a20 * b01 * b12 +
                    a12 * b01 * b20 - a11 * b02 * b20 - a02 * b11 * b20 +
                    a01 * b12 * b20 - a12 * b00 * b21 + a10 * b02 * b21 +
                    a02 * b10 * b21 - a00 * b12 * b21 + a11 * b00 * b22 -
                    a10 * b01 * b22 - a01 * b10 * b22 + a00 * b11 * b22;

    double constant = -b02 * b11 * b20 + b01 * b12 * b20 + b02 * b10 * b21 -
                      b00 * b12 * b21 - b01 * b10 * b22 + b00 * b11 * b22;

    return {cubic, quadratic, linear, constant};
}

double NormalizedResidual(const Conic2d& conic, const Point2d& p) {
    double scale = MaxAbsEntry(conic) * std::max(1.0, p.x * p.x + p.y * p.y);
    if (scale <= 0.0) {
        return 0.0;
    }
    return std::abs(conic.Evaluate(p)) / scale;
}

// =============================================================================
// IntersectConics
// =============================================================================

ConicIntersectionResult IntersectConics(const Conic2d& a, const Conic2d& b,
                                        const ConicIntersectionParams& params) {
    Validate::RequireValid(a, "a", "IntersectConics");
    Validate::RequireValid(b, "b", "IntersectConics");

    Tracer tracer(params.trace, params.traceCallback);
    ConicIntersectionResult result;

    // Step 1: degenerate members of the pencil l * a + b
    std::array<double, 4> k = PencilCubicCoefficients(a, b);
    Internal::PolynomialRoots roots = Internal::SolveCubic(
        Complex::Real(k[0]), Complex::Real(k[1]), Complex::Real(k[2]), Complex::Real(k[3]));

    if (!roots.HasRoots()) {
        // No usable pencil parameter, most likely the conics overlap entirely
        tracer.Emit(TraceStage::CubicSolved, "no roots, treating as overlap");
        result.overlapping = true;
        return result;
    }

    for (const Complex& lambda : roots) {
        if (std::find(result.lambdas.begin(), result.lambdas.end(), lambda) == result.lambdas.end()) {
            result.lambdas.push_back(lambda);
        }
    }

    if (tracer.Enabled()) {
        std::ostringstream oss;
        oss << "cubic [" << k[0] << ", " << k[1] << ", " << k[2] << ", " << k[3] << "] lambdas";
        for (const auto& lambda : result.lambdas) {
            oss << " " << lambda;
        }
        tracer.Emit(TraceStage::CubicSolved, oss.str());
    }

    Internal::Mat33c matA = Internal::Mat33c::FromReal(a.ToMatrix());
    Internal::Mat33c matB = Internal::Mat33c::FromReal(b.ToMatrix());
    double scaleA = MaxAbsEntry(a);
    double scaleB = MaxAbsEntry(b);

    std::vector<Internal::Mat33c> members;
    for (const auto& lambda : result.lambdas) {
        Internal::Mat33c member = PencilMember(lambda, matA, matB);

        // l * a + b == 0 means a and b are proportional: same zero set
        double scale = std::max(lambda.Magnitude() * scaleA, scaleB);
        if (member.MaxMagnitude() <= PENCIL_MEMBER_ZERO_TOLERANCE * scale) {
            tracer.Emit(TraceStage::DegenerateConics, "vanishing pencil member, conics overlap");
            result.lambdas.clear();
            result.overlapping = true;
            return result;
        }
        members.push_back(member);
    }

    // Step 2: line pairs and real solutions per member
    for (size_t i = 0; i < members.size(); ++i) {
        const Internal::Mat33c& member = members[i];
        Internal::LinePair pair = Internal::DecomposeDegenerateConic(member);
        Internal::RealSolutionSet solutions = Internal::ExtractRealSolutions(member);

        if (!solutions.Ok()) {
            std::ostringstream oss;
            oss << "IntersectConics: no complex solution on pencil member for lambda "
                << result.lambdas[i];
            throw UnsolvableBootstrapException(oss.str());
        }

        if (tracer.Enabled()) {
            std::ostringstream oss;
            oss << "lambda " << result.lambdas[i] << " det " << Internal::Determinant(member);
            tracer.Emit(TraceStage::DegenerateConics, oss.str());
            tracer.Emit(TraceStage::LinePairs, FormatLine(pair.first) + " x " + FormatLine(pair.second));
            tracer.Emit(TraceStage::RealSolutions, FormatSolutions(solutions.solutions));
        }

        result.degenerateConicMatrices.push_back(member);
        result.lines.push_back(pair);
        result.intersectionCollections.push_back(std::move(solutions.solutions));
    }

    // Step 3: cross each member's own pair, then every later member's pair
    std::vector<Point2d> candidates;
    auto addCrossing = [&](const Internal::ComplexLine& l1, const Internal::ComplexLine& l2) {
        std::optional<Point2d> p = Internal::IntersectComplexLines(l1, l2);
        if (p) {
            candidates.push_back(*p);
        }
    };

    for (size_t i = 0; i < result.lines.size(); ++i) {
        const Internal::LinePair& first = result.lines[i];
        addCrossing(first.first, first.second);

        for (size_t j = i + 1; j < result.lines.size(); ++j) {
            const Internal::LinePair& second = result.lines[j];
            addCrossing(first.first, second.first);
            addCrossing(first.first, second.second);
            addCrossing(first.second, second.first);
            addCrossing(first.second, second.second);
        }
    }

    // Step 4: real crossings of complex line pairs need not lie on the conics
    for (const auto& p : candidates) {
        if (params.residualTolerance >= 0.0 &&
            (NormalizedResidual(a, p) > params.residualTolerance ||
             NormalizedResidual(b, p) > params.residualTolerance)) {
            ++result.rejectedCount;
            continue;
        }
        result.points.push_back(p);
    }

    if (tracer.Enabled()) {
        std::string text = std::to_string(result.points.size()) + " points, " +
                           std::to_string(result.rejectedCount) + " rejected";
        for (const auto& p : result.points) {
            text += " " + FormatPoint(p);
        }
        tracer.Emit(TraceStage::Points, text);
    }

    return result;
}

} // namespace Qi::Conic
