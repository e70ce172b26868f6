#pragma once

#include "profile.hpp"

namespace gpx_profiler
{
namespace units
{
constexpr double MILES_PER_KM = 0.621371192;
constexpr double FEET_PER_METER = 3.2808399;
constexpr double MILES_PER_METER = MILES_PER_KM / 1000.0;
constexpr double MPH_PER_MPS = MILES_PER_KM * 3.6;
} // namespace units

// Rescales a profile between unit systems and re-expresses its timestamps in
// another timezone. Never changes sample count, order or segment flags.
class unit_converter_t
{
public:
  unit_converter_t(unit_system_t target_units, timezone_t target_timezone);

  auto convert(const profile_t &profile) const -> profile_t;

private:
  unit_system_t m_target_units;
  timezone_t m_target_timezone;

  // Multiplier taking a value from the source system into the target system
  auto distance_factor(unit_system_t from) const -> double;
  auto velocity_factor(unit_system_t from) const -> double;
  auto elevation_factor(unit_system_t from) const -> double;
};

} // namespace gpx_profiler
