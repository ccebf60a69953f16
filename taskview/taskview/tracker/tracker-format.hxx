#pragma once

#include <string>
#include <cstdint>

#include <taskview/tracker/tracker-types.hxx>

namespace taskview
{
  // Format bytes as human-readable string (e.g., "1.5 MiB").
  //
  std::string
  format_bytes (std::uint64_t bytes);

  // Format speed as human-readable string (e.g., "2.5 MiB/s").
  //
  std::string
  format_speed (double bytes_per_sec);

  // Format a remaining time estimate (e.g., "1m 30s").
  //
  std::string
  format_duration (std::int64_t seconds);

  // Format an elapsed time rounded to the millisecond (e.g., "1.234s",
  // "15ms", "2m3.500s").
  //
  std::string
  format_elapsed (duration_type elapsed);
}
