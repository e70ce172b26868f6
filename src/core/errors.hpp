#pragma once

#include <stdexcept>
#include <string>

namespace gpx_profiler
{

// Malformed or unreadable track input
class parse_error_t : public std::runtime_error
{
public:
  parse_error_t(const std::string &message, int line = 0)
      : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + message : message), m_line(line)
  {
  }

  // 1-based line of the offending construct, 0 if unknown
  auto line() const -> int { return m_line; }

private:
  int m_line;
};

// Requested profile axis needs data that no point in the track carries
class missing_data_error_t : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Bad configuration value (resample target, unit, timezone, axis name)
class invalid_argument_error_t : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

} // namespace gpx_profiler
