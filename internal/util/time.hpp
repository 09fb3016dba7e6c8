#pragma once

#include <chrono>
#include <cstdint>

namespace availability::util {

/*
  Time utilities: the single place that reads the wall clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace availability::util
