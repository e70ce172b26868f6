#pragma once

#include "time_util.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace gpx_profiler
{

// A single GPS fix
struct point_t
{
  double lat = 0.0; // Degrees, [-90, 90]
  double lon = 0.0; // Degrees, [-180, 180]
  std::optional<double> elevation; // Meters
  std::optional<time_point_t> time;
};

// Continuous recording run
using segment_t = std::vector<point_t>;

struct track_t
{
  std::vector<segment_t> segments;

  auto point_count() const -> size_t
  {
    size_t count = 0;
    for (const auto &segment : segments)
      count += segment.size();
    return count;
  }

  auto has_elevation() const -> bool
  {
    for (const auto &segment : segments)
      for (const auto &point : segment)
        if (point.elevation)
          return true;
    return false;
  }

  auto has_time() const -> bool
  {
    for (const auto &segment : segments)
      for (const auto &point : segment)
        if (point.time)
          return true;
    return false;
  }
};

} // namespace gpx_profiler
