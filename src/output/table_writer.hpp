#pragma once

#include "core/profile.hpp"
#include <ostream>

namespace gpx_profiler
{

// Whitespace-separated profile table, one row per sample and a blank line after
// each segment. Absent values are printed as '?'.
class table_writer_t
{
public:
  static auto write(std::ostream &out, const profile_t &profile) -> void;

  // Scale from profile units to the units shown in tables and plots
  // (km and km/h for metric, miles and mph for imperial)
  static auto display_distance(const profile_t &profile, double distance) -> double;
  static auto display_velocity(const profile_t &profile, double velocity) -> double;

  static auto distance_unit(unit_system_t units) -> const char *;
  static auto elevation_unit(unit_system_t units) -> const char *;
  static auto velocity_unit(unit_system_t units) -> const char *;
};

} // namespace gpx_profiler
