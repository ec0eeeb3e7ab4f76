#include "time.hpp"

namespace tkv::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(std::int64_t nanos) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

} // namespace tkv::util
