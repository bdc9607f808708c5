/**
 * @file ConicIntersectionAccuracyTest.cpp
 * @brief Precision/accuracy tests for Conic/ConicIntersection
 *
 * Test methodology:
 * 1. Generate random circle and ellipse pairs (centers in [-5, 5], axes in [0.5, 4])
 * 2. Intersect them
 * 3. Measure how far every returned point is from both conics
 * 4. For circle pairs, compare the point count with the closed-form answer
 *
 * Near-tangent configurations are excluded from the count checks, since a
 * tangency perturbed by rounding may legitimately split or vanish.
 */

#include <QiConic/Conic/ConicIntersection.h>
#include <QiConic/Core/Constants.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <vector>

namespace Qi::Conic {
namespace {

// =============================================================================
// Constants
// =============================================================================

constexpr int NUM_TRIALS_STANDARD = 1000;

/// |Q(p)| for every reported point
constexpr double CONIC_RESIDUAL_REQUIREMENT = 1e-6;

/// Distance from a reported point to each circle
constexpr double CIRCLE_DISTANCE_REQUIREMENT = 1e-6;

/// Configurations closer than this to tangency are skipped in count checks
constexpr double TANGENCY_MARGIN = 1e-3;

// =============================================================================
// Random Input
// =============================================================================

class ConicAccuracyTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng_.seed(20240615);
    }

    double Uniform(double lo, double hi) {
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(rng_);
    }

    Circle2d RandomCircle() {
        return Circle2d(Uniform(-5.0, 5.0), Uniform(-5.0, 5.0), Uniform(0.5, 4.0));
    }

    Ellipse2d RandomEllipse() {
        return Ellipse2d(Uniform(-5.0, 5.0), Uniform(-5.0, 5.0),
                         Uniform(0.5, 4.0), Uniform(0.5, 4.0), Uniform(0.0, PI));
    }

    static double MaxResidual(const ConicIntersectionResult& result, const Conic2d& a, const Conic2d& b) {
        double worst = 0.0;
        for (const auto& p : result.points) {
            worst = std::max({worst, std::abs(a.Evaluate(p)), std::abs(b.Evaluate(p))});
        }
        return worst;
    }

    std::mt19937 rng_;
};

// =============================================================================
// Circle Pairs
// =============================================================================

TEST_F(ConicAccuracyTest, CirclePairs_CountMatchesGeometry) {
    int tested = 0;
    double worstDistance = 0.0;

    for (int trial = 0; trial < NUM_TRIALS_STANDARD; ++trial) {
        Circle2d c1 = RandomCircle();
        Circle2d c2 = RandomCircle();
        double d = c1.center.DistanceTo(c2.center);
        double sum = c1.radius + c2.radius;
        double diff = std::abs(c1.radius - c2.radius);
        if (d < TANGENCY_MARGIN || std::abs(d - sum) < TANGENCY_MARGIN ||
            std::abs(d - diff) < TANGENCY_MARGIN) {
            continue;
        }
        size_t expected = (d > diff && d < sum) ? 2u : 0u;

        ConicIntersectionResult result = IntersectConics(Conic2d::FromCircle(c1), Conic2d::FromCircle(c2));
        std::vector<Point2d> unique = result.UniquePoints();
        EXPECT_EQ(unique.size(), expected) << "trial " << trial << ", d = " << d
                                           << ", r1 = " << c1.radius << ", r2 = " << c2.radius;

        for (const auto& p : unique) {
            double e1 = std::abs(p.DistanceTo(c1.center) - c1.radius);
            double e2 = std::abs(p.DistanceTo(c2.center) - c2.radius);
            worstDistance = std::max({worstDistance, e1, e2});
        }
        ++tested;
    }

    std::cout << "  Circle pairs tested: " << tested
              << ", worst distance error: " << worstDistance << std::endl;
    EXPECT_GT(tested, NUM_TRIALS_STANDARD / 2);
    EXPECT_LT(worstDistance, CIRCLE_DISTANCE_REQUIREMENT);
}

// =============================================================================
// Ellipse Pairs
// =============================================================================

TEST_F(ConicAccuracyTest, EllipsePairs_PointsLieOnBothConics) {
    double worst = 0.0;
    int totalPoints = 0;

    for (int trial = 0; trial < NUM_TRIALS_STANDARD; ++trial) {
        Conic2d a = Conic2d::FromEllipse(RandomEllipse());
        Conic2d b = Conic2d::FromEllipse(RandomEllipse());

        ConicIntersectionResult result = IntersectConics(a, b);
        EXPECT_FALSE(result.overlapping);
        EXPECT_LE(result.UniquePoints().size(), 4u);

        worst = std::max(worst, MaxResidual(result, a, b));
        totalPoints += result.Count();
    }

    std::cout << "  Ellipse points: " << totalPoints << ", worst |Q(p)|: " << worst << std::endl;
    EXPECT_GT(totalPoints, 0);
    EXPECT_LT(worst, CONIC_RESIDUAL_REQUIREMENT);
}

TEST_F(ConicAccuracyTest, MixedPairs_PointsLieOnBothConics) {
    double worst = 0.0;

    for (int trial = 0; trial < NUM_TRIALS_STANDARD; ++trial) {
        Conic2d a = Conic2d::FromEllipse(RandomEllipse());
        Conic2d b = Conic2d::FromCircle(RandomCircle());
        worst = std::max(worst, MaxResidual(IntersectConics(a, b), a, b));
    }

    EXPECT_LT(worst, CONIC_RESIDUAL_REQUIREMENT);
}

// =============================================================================
// Scale Invariance
// =============================================================================

TEST_F(ConicAccuracyTest, ScaledMatrices_SamePoints) {
    for (int trial = 0; trial < 100; ++trial) {
        Conic2d a = Conic2d::FromEllipse(RandomEllipse());
        Conic2d b = Conic2d::FromEllipse(RandomEllipse());
        Conic2d bScaled = Conic2d::FromMatrix(b.ToMatrix() * 250.0);

        std::vector<Point2d> ref = IntersectConics(a, b).UniquePoints();
        std::vector<Point2d> scaled = IntersectConics(a, bScaled).UniquePoints();
        ASSERT_EQ(ref.size(), scaled.size()) << "trial " << trial;

        for (const auto& p : ref) {
            double nearest = 1e300;
            for (const auto& q : scaled) {
                nearest = std::min(nearest, p.DistanceTo(q));
            }
            EXPECT_LT(nearest, 1e-4) << "trial " << trial;
        }
    }
}

} // namespace
} // namespace Qi::Conic
