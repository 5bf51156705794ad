/**
 * @file clock.hpp
 * @brief Injectable wall clock.
 */
#ifndef ARTICLESYNC_UTIL_CLOCK_HPP
#define ARTICLESYNC_UTIL_CLOCK_HPP

#include <chrono>
#include <functional>

namespace arsync {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

/// Source of "now". Components take one so tests can move time by hand.
using ClockFn = std::function<TimePoint()>;

inline ClockFn system_clock_fn() {
  return [] { return WallClock::now(); };
}

} // namespace arsync

#endif // ARTICLESYNC_UTIL_CLOCK_HPP
