#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sitestore::util {

/*
  Time utilities: single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to Now.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

// 2026-01-19T12:34:56.123Z
std::string ToIso8601(TimePoint tp);

} // namespace sitestore::util
