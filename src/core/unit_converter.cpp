#include "unit_converter.hpp"
#include <utility>

namespace gpx_profiler
{

unit_converter_t::unit_converter_t(unit_system_t target_units, timezone_t target_timezone)
    : m_target_units(target_units), m_target_timezone(std::move(target_timezone))
{
}

auto unit_converter_t::distance_factor(unit_system_t from) const -> double
{
  if (from == m_target_units)
    return 1.0;
  return m_target_units == unit_system_t::Imperial ? units::MILES_PER_METER : 1.0 / units::MILES_PER_METER;
}

auto unit_converter_t::velocity_factor(unit_system_t from) const -> double
{
  if (from == m_target_units)
    return 1.0;
  return m_target_units == unit_system_t::Imperial ? units::MPH_PER_MPS : 1.0 / units::MPH_PER_MPS;
}

auto unit_converter_t::elevation_factor(unit_system_t from) const -> double
{
  if (from == m_target_units)
    return 1.0;
  return m_target_units == unit_system_t::Imperial ? units::FEET_PER_METER : 1.0 / units::FEET_PER_METER;
}

auto unit_converter_t::convert(const profile_t &profile) const -> profile_t
{
  const double k_dist = distance_factor(profile.units);
  const double k_vel = velocity_factor(profile.units);
  const double k_ele = elevation_factor(profile.units);

  profile_t converted = profile;
  converted.units = m_target_units;
  converted.timezone = m_target_timezone;

  for (auto &sample : converted.samples)
  {
    sample.distance *= k_dist;
    if (sample.elevation)
      *sample.elevation *= k_ele;
    if (sample.velocity)
      *sample.velocity *= k_vel;

    sample.utc_offset = sample.time ? m_target_timezone.offset_at(*sample.time) : std::chrono::seconds{0};
  }

  return converted;
}

} // namespace gpx_profiler
