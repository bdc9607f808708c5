#pragma once

/**
 * @file Trace.h
 * @brief Optional diagnostic trace output for QiConic algorithms
 *
 * Tracing is off by default. It is enabled per call (e.g.
 * ConicIntersectionParams::trace) or process-wide by setting the environment
 * variable QICONIC_TRACE to any value other than "" or "0". Events go to a
 * user callback when one is set, otherwise to stderr with a "[QiConic]" prefix.
 * A disabled tracer does no formatting work.
 */

#include <QiConic/Core/Export.h>

#include <functional>
#include <string>

namespace Qi::Conic {

/**
 * @brief Pipeline stage that produced a trace event
 */
enum class TraceStage {
    CubicSolved,        ///< Pencil parameter roots
    DegenerateConics,   ///< Degenerate pencil members and their determinants
    LinePairs,          ///< Decomposed line pairs
    RealSolutions,      ///< Real solutions per pencil member
    Points              ///< Final intersection points
};

/**
 * @brief A single trace record
 */
struct TraceEvent {
    TraceStage stage = TraceStage::CubicSolved;
    std::string message;
};

using TraceCallback = std::function<void(const TraceEvent& event)>;

/// Stage name, e.g. "CubicSolved"
QICONIC_API const char* TraceStageName(TraceStage stage);

/// True if QICONIC_TRACE requests tracing (read once, then cached)
QICONIC_API bool IsTraceEnvEnabled();

/**
 * @brief Routes trace events to a callback or stderr
 */
class QICONIC_API Tracer {
public:
    Tracer() = default;
    Tracer(bool enabled, TraceCallback callback);

    bool Enabled() const { return enabled_; }

    /// Deliver an event; no-op when disabled
    void Emit(TraceStage stage, const std::string& message) const;

private:
    bool enabled_ = false;
    TraceCallback callback_;
};

} // namespace Qi::Conic
