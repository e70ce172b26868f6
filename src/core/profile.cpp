#include "profile.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace gpx_profiler
{

auto parse_unit_system(const std::string &name) -> unit_system_t
{
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "metric" || lower == "si")
    return unit_system_t::Metric;
  if (lower == "imperial" || lower == "english")
    return unit_system_t::Imperial;
  throw invalid_argument_error_t("unknown unit system: " + name);
}

auto to_string(unit_system_t units) -> const char *
{
  return units == unit_system_t::Imperial ? "imperial" : "metric";
}

} // namespace gpx_profiler
