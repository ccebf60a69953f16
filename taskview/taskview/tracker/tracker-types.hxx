#pragma once

#include <chrono>

namespace taskview
{
  // Clock used for every event and tracker timestamp.
  //
  // We need a monotonic clock here: the rate filter divides by the distance
  // between samples and a wall clock adjustment would show up as a spike (or
  // a negative interval).
  //
  using clock_type = std::chrono::steady_clock;
  using time_point = clock_type::time_point;
  using duration_type = clock_type::duration;
}
