#pragma once

#include <chrono>
#include <functional>

namespace tollgate {

/// Alias some types to make it easier to use.
/// Availability deadlines are measured on the steady clock: they only need to be compared with each other,
/// never converted to wall-clock time, and must not jump when the system time is adjusted.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

// Injectable time source. Production code uses SteadyClock::now, tests may provide a manual clock.
using NowFunction = std::function<SteadyTimePoint()>;

}  // namespace tollgate
