/**
 * @file test_trace.cpp
 * @brief Unit tests for Core/Trace and Core/Validate
 */

#include <QiConic/Core/Trace.h>
#include <QiConic/Core/Validate.h>
#include <QiConic/Core/Types.h>
#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

namespace Qi::Conic {
namespace {

// =============================================================================
// Tracer Tests
// =============================================================================

TEST(TraceTest, StageNames) {
    EXPECT_STREQ(TraceStageName(TraceStage::CubicSolved), "CubicSolved");
    EXPECT_STREQ(TraceStageName(TraceStage::DegenerateConics), "DegenerateConics");
    EXPECT_STREQ(TraceStageName(TraceStage::LinePairs), "LinePairs");
    EXPECT_STREQ(TraceStageName(TraceStage::RealSolutions), "RealSolutions");
    EXPECT_STREQ(TraceStageName(TraceStage::Points), "Points");
}

TEST(TraceTest, EnabledTracerCallsCallback) {
    std::vector<TraceEvent> events;
    Tracer tracer(true, [&](const TraceEvent& e) { events.push_back(e); });

    ASSERT_TRUE(tracer.Enabled());
    tracer.Emit(TraceStage::Points, "2 points");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].stage, TraceStage::Points);
    EXPECT_EQ(events[0].message, "2 points");
}

TEST(TraceTest, DisabledTracerIsSilent) {
    if (IsTraceEnvEnabled()) {
        GTEST_SKIP() << "QICONIC_TRACE is set";
    }
    int calls = 0;
    Tracer tracer(false, [&](const TraceEvent&) { ++calls; });

    EXPECT_FALSE(tracer.Enabled());
    tracer.Emit(TraceStage::CubicSolved, "ignored");
    EXPECT_EQ(calls, 0);
}

TEST(TraceTest, DefaultTracerIsDisabled) {
    Tracer tracer;
    EXPECT_FALSE(tracer.Enabled());
}

// =============================================================================
// Validate Tests
// =============================================================================

TEST(ValidateTest, RequireFinite) {
    EXPECT_NO_THROW(Validate::RequireFinite(1.0, "x", "Test"));
    EXPECT_THROW(Validate::RequireFinite(std::nan(""), "x", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireFinite(INFINITY, "x", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, RequirePositive) {
    EXPECT_NO_THROW(Validate::RequirePositive(0.5, "r", "Test"));
    EXPECT_THROW(Validate::RequirePositive(0.0, "r", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequirePositive(-1.0, "r", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, RequireNonNegative) {
    EXPECT_NO_THROW(Validate::RequireNonNegative(0.0, "r", "Test"));
    EXPECT_THROW(Validate::RequireNonNegative(-1e-9, "r", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, MessageFormat) {
    try {
        Validate::RequirePositive(-2.5, "radius", "FromCircle");
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(std::string(e.what()), "Invalid argument: FromCircle: radius must be > 0 (got -2.5)");
    }
}

TEST(ValidateTest, RequireValid) {
    EXPECT_NO_THROW(Validate::RequireValid(Circle2d(0.0, 0.0, 1.0), "circle", "Test"));
    EXPECT_THROW(Validate::RequireValid(Circle2d(0.0, 0.0, -1.0), "circle", "Test"),
                 InvalidArgumentException);
}

} // namespace
} // namespace Qi::Conic
