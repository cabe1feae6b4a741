#pragma once

#include <chrono>
#include <cstdint>

namespace reqctl::util {

/*
  Record timestamps, as reported by the host.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Hosts report request time as fractional milliseconds since the epoch.
TimePoint FromUnixMillis(double ms);

} // namespace reqctl::util
