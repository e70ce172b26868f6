#include "plot_axes.hpp"
#include "errors.hpp"
#include <map>

namespace gpx_profiler
{

auto parse_axis(const std::string &name) -> axis_t
{
  static const std::map<std::string, axis_t> names = {
      {"t", axis_t::Time},         {"time", axis_t::Time},
      {"d", axis_t::Distance},     {"dist", axis_t::Distance},     {"distance", axis_t::Distance},
      {"a", axis_t::Elevation},    {"alt", axis_t::Elevation},     {"altitude", axis_t::Elevation},
      {"ele", axis_t::Elevation},  {"elevation", axis_t::Elevation},
      {"v", axis_t::Velocity},     {"vel", axis_t::Velocity},      {"velocity", axis_t::Velocity},
  };

  auto it = names.find(name);
  if (it == names.end())
    throw invalid_argument_error_t("unknown variable: " + name);
  return it->second;
}

auto to_string(axis_t axis) -> const char *
{
  switch (axis)
  {
  case axis_t::Time:
    return "time";
  case axis_t::Distance:
    return "distance";
  case axis_t::Elevation:
    return "elevation";
  case axis_t::Velocity:
    return "velocity";
  }
  return "unknown";
}

auto plot_axes_t::validate() const -> void
{
  if (x != axis_t::Time && x != axis_t::Distance)
    throw invalid_argument_error_t(std::string("x axis must be time or distance, got ") + to_string(x));
  if (y != axis_t::Elevation && y != axis_t::Velocity)
    throw invalid_argument_error_t(std::string("y axis must be elevation or velocity, got ") + to_string(y));
}

auto plot_axes_t::check_data(const track_t &track) const -> void
{
  // An empty track yields an empty profile, not an error
  if (track.point_count() == 0)
    return;

  bool needs_time = x == axis_t::Time || y == axis_t::Velocity;
  if (needs_time && !track.has_time())
    throw missing_data_error_t(std::string("track has no timestamps, cannot plot ") + to_string(y) + " against " + to_string(x));
  if (y == axis_t::Elevation && !track.has_elevation())
    throw missing_data_error_t("track has no elevation data");
}

} // namespace gpx_profiler
