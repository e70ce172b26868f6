#pragma once

#include "track.hpp"
#include <string>

namespace gpx_profiler
{

class track_parser_t
{
public:
  // Parse a GPX 1.0/1.1 document held in memory. Each <trkseg> becomes a segment;
  // documents without any <trkseg> fall back to <rte> routes.
  // Throws parse_error_t on malformed XML, a non-<gpx> root, points or segments outside
  // their GPX parent and unreadable coordinates, elevations or timestamps.
  static auto parse_gpx(const std::string &content) -> track_t;

private:
  static auto parse_coordinate(const std::string &text, const char *what, double limit, int line) -> double;
  static auto parse_elevation(const std::string &text, int line) -> std::optional<double>;
  static auto parse_time(const std::string &text, int line) -> std::optional<time_point_t>;
};

} // namespace gpx_profiler
