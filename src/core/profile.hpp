#pragma once

#include "time_util.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gpx_profiler
{

enum class unit_system_t
{
  Metric = 0,  // meters, meters/second, meters
  Imperial = 1 // miles, miles/hour, feet
};

auto parse_unit_system(const std::string &name) -> unit_system_t;
auto to_string(unit_system_t units) -> const char *;

// One derived profile record per source point
struct sample_t
{
  std::optional<double> elapsed_sec; // Since the first timestamp of the track
  double distance = 0.0;             // Cumulative, meters or miles
  std::optional<double> elevation;   // Meters or feet
  std::optional<double> velocity;    // m/s or mph
  int segment_index = 0;
  bool segment_start = false;

  std::optional<time_point_t> time;      // UTC instant of the source fix
  std::chrono::seconds utc_offset{0};    // Offset of the profile timezone at time

  // Wall-clock time in the profile timezone
  auto local_time() const -> std::optional<time_point_t>
  {
    if (!time)
      return std::nullopt;
    return *time + utc_offset;
  }
};

struct profile_t
{
  std::vector<sample_t> samples;

  unit_system_t units = unit_system_t::Metric;
  timezone_t timezone;
  size_t original_point_count = 0;
  size_t resampled_point_count = 0;
  size_t non_monotonic_steps = 0; // Steps whose timestamp went backwards

  auto empty() const -> bool { return samples.empty(); }
};

} // namespace gpx_profiler
