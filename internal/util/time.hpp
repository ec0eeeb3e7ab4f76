#pragma once

#include <chrono>
#include <cstdint>

namespace tkv::util {

/*
  Time utilities. Single place to control the clock source.

  Index scores are nanoseconds since the Unix epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixNanos(TimePoint tp);
TimePoint    FromUnixNanos(std::int64_t nanos);

} // namespace tkv::util
