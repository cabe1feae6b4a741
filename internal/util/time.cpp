#include "time.hpp"

namespace reqctl::util {

TimePoint FromUnixMillis(double ms) {
  const auto micros = static_cast<int64_t>(ms * 1000.0);
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

} // namespace reqctl::util
