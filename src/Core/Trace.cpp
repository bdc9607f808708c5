/**
 * @file Trace.cpp
 * @brief Implementation of diagnostic trace output
 */

#include <QiConic/Core/Trace.h>

#include <cstdio>
#include <cstdlib>
#include <utility>

namespace Qi::Conic {

const char* TraceStageName(TraceStage stage) {
    switch (stage) {
        case TraceStage::CubicSolved:      return "CubicSolved";
        case TraceStage::DegenerateConics: return "DegenerateConics";
        case TraceStage::LinePairs:        return "LinePairs";
        case TraceStage::RealSolutions:    return "RealSolutions";
        case TraceStage::Points:           return "Points";
        default:                           return "Unknown";
    }
}

bool IsTraceEnvEnabled() {
    static const bool enabled = [] {
        const char* env = std::getenv("QICONIC_TRACE");
        return env != nullptr && env[0] != '\0' && !(env[0] == '0' && env[1] == '\0');
    }();
    return enabled;
}

Tracer::Tracer(bool enabled, TraceCallback callback)
    : enabled_(enabled || IsTraceEnvEnabled()), callback_(std::move(callback)) {}

void Tracer::Emit(TraceStage stage, const std::string& message) const {
    if (!enabled_) {
        return;
    }
    if (callback_) {
        callback_(TraceEvent{stage, message});
        return;
    }
    std::fprintf(stderr, "[QiConic] %s: %s\n", TraceStageName(stage), message.c_str());
}

} // namespace Qi::Conic
