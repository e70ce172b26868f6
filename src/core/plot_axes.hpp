#pragma once

#include "track.hpp"
#include <string>

namespace gpx_profiler
{

enum class axis_t
{
  Time = 0,
  Distance = 1,
  Elevation = 2,
  Velocity = 3
};

// Accepts the short and long names: t/time, d/dist/distance,
// a/alt/altitude/ele/elevation, v/vel/velocity
auto parse_axis(const std::string &name) -> axis_t;
auto to_string(axis_t axis) -> const char *;

struct plot_axes_t
{
  axis_t x = axis_t::Distance;
  axis_t y = axis_t::Elevation;

  // x must be time or distance, y elevation or velocity
  auto validate() const -> void;

  // Fails with missing_data_error_t if no point of the track carries what the axes need
  auto check_data(const track_t &track) const -> void;
};

} // namespace gpx_profiler
