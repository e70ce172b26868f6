#pragma once

#include "plot_axes.hpp"
#include "profile.hpp"
#include "track.hpp"
#include <optional>
#include <string>

namespace gpx_profiler
{

enum class output_action_t
{
  Table = 0,         // Tabular data on stdout
  GnuplotScript = 1, // Print gnuplot script
  Gnuplot = 2,       // Pipe the script into gnuplot
  Json = 3
};

auto parse_output_action(const std::string &name) -> output_action_t;
auto to_string(output_action_t action) -> const char *;

struct profile_options_t
{
  plot_axes_t axes;
  unit_system_t units = unit_system_t::Metric;
  std::string timezone = "UTC";
  std::optional<int> resample_points; // nullopt = keep every point

  output_action_t action = output_action_t::Table;
  std::string image_file; // Empty = interactive plot
  bool verbose = false;
};

// Parse -> check axes -> build -> resample -> convert
class profile_pipeline_t
{
public:
  // Validates the options up front, throws invalid_argument_error_t
  explicit profile_pipeline_t(const profile_options_t &options);

  auto run(const std::string &gpx_content) const -> profile_t;
  auto run(const track_t &track) const -> profile_t;

private:
  profile_options_t m_options;
  timezone_t m_timezone;
};

} // namespace gpx_profiler
