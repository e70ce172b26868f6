#include "table_writer.hpp"
#include "core/time_util.hpp"
#include <cstdio>

namespace gpx_profiler
{

namespace
{

auto format_value(const std::optional<double> &value) -> std::string
{
  if (!value)
    return "?";
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%f", *value);
  return buffer;
}

} // namespace

auto table_writer_t::display_distance(const profile_t &profile, double distance) -> double
{
  return profile.units == unit_system_t::Metric ? distance / 1000.0 : distance;
}

auto table_writer_t::display_velocity(const profile_t &profile, double velocity) -> double
{
  return profile.units == unit_system_t::Metric ? velocity * 3.6 : velocity;
}

auto table_writer_t::distance_unit(unit_system_t units) -> const char * { return units == unit_system_t::Metric ? "km" : "miles"; }

auto table_writer_t::elevation_unit(unit_system_t units) -> const char * { return units == unit_system_t::Metric ? "m" : "ft"; }

auto table_writer_t::velocity_unit(unit_system_t units) -> const char * { return units == unit_system_t::Metric ? "km/h" : "miles/h"; }

auto table_writer_t::write(std::ostream &out, const profile_t &profile) -> void
{
  out << "# time(ISO) elevation(" << elevation_unit(profile.units) << ") distance(" << distance_unit(profile.units) << ") velocity("
      << velocity_unit(profile.units) << ")\n";

  for (size_t i = 0; i < profile.samples.size(); ++i)
  {
    const sample_t &sample = profile.samples[i];
    if (sample.segment_start && i > 0)
      out << "\n";

    std::optional<double> velocity;
    if (sample.velocity)
      velocity = display_velocity(profile, *sample.velocity);

    out << (sample.time ? time_util::format_iso8601(*sample.time, sample.utc_offset) : std::string("?")) << ' ' << format_value(sample.elevation)
        << ' ' << format_value(display_distance(profile, sample.distance)) << ' ' << format_value(velocity) << "\n";
  }

  if (!profile.samples.empty())
    out << "\n";
}

} // namespace gpx_profiler
