#pragma once

#include <cstdint>
#include <variant>

namespace kineticEngine {

/// Fixed number of simulation ticks per second.
struct StaticFrameRate {
    int64_t ticksPerSecond = 60;
};

/// Frames advance by measured wall-clock time.
struct DynamicFrameRate {};

using FrameRate = std::variant<StaticFrameRate, DynamicFrameRate>;

/// Elapsed time expressed in ticks (only valid with a StaticFrameRate).
struct UpdateTime {
    int64_t ticks = 0;
};

/// Elapsed time expressed in seconds (only valid with a DynamicFrameRate).
struct ClockTime {
    float seconds = 0.0f;
};

using StepTime = std::variant<UpdateTime, ClockTime>;

}  // namespace kineticEngine
