#pragma once

#include <chrono>

namespace batchpress {

// Elapsed time measurements use a monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

// Milliseconds as a floating point value, the unit in which compression timings are reported.
using MillisecondsDouble = std::chrono::duration<double, std::milli>;

inline double ElapsedMs(SteadyTimePoint start, SteadyTimePoint end = SteadyClock::now()) {
  return std::chrono::duration_cast<MillisecondsDouble>(end - start).count();
}

}  // namespace batchpress
