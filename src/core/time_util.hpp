#pragma once

#include <chrono>
#include <optional>
#include <string>

#if defined(__cpp_lib_chrono) && __cpp_lib_chrono >= 201907L
#define GPX_PROFILER_HAS_TZDB 1
#else
#define GPX_PROFILER_HAS_TZDB 0
#endif

namespace gpx_profiler
{

// UTC instant with millisecond resolution
using time_point_t = std::chrono::sys_time<std::chrono::milliseconds>;

namespace time_util
{

// Accepts YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]; no designator means UTC.
// Returns nullopt if the text is not a valid timestamp.
auto parse_iso8601(const std::string &text) -> std::optional<time_point_t>;

// Formats utc shifted by offset, suffixed with Z or the numeric offset.
auto format_iso8601(time_point_t utc, std::chrono::seconds offset = std::chrono::seconds{0}) -> std::string;

// Seconds between two instants (b - a), may be negative
inline auto seconds_between(time_point_t a, time_point_t b) -> double
{
  return std::chrono::duration<double>(b - a).count();
}

} // namespace time_util

// Target timezone for displayed timestamps: UTC, a fixed offset or an IANA zone
class timezone_t
{
public:
  timezone_t();

  // "UTC", "Z", "+03:00", "-0530", "UTC+2", or an IANA name like "Europe/Moscow".
  // Throws invalid_argument_error_t for anything else.
  static auto parse(const std::string &name) -> timezone_t;

  auto offset_at(time_point_t utc) const -> std::chrono::seconds;
  auto name() const -> const std::string &;
  auto is_utc() const -> bool;

private:
  std::string m_name;
  std::chrono::seconds m_fixed_offset;
#if GPX_PROFILER_HAS_TZDB
  const std::chrono::time_zone *m_zone = nullptr;
#endif
};

} // namespace gpx_profiler
