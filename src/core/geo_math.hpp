#pragma once

#include "track.hpp"
#include <algorithm>
#include <cmath>

namespace gpx_profiler
{
namespace geo
{
constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6371000.8; // Volumetric mean radius (meters)

inline auto deg_to_rad(double deg) -> double
{
  return deg * PI / 180.0;
}

// sin^2(theta / 2)
inline auto haversin(double theta) -> double
{
  double s = std::sin(0.5 * theta);
  return s * s;
}

// Calculate distance between two points in meters (Haversine, spherical Earth)
inline auto distance(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = deg_to_rad(lat1);
  double lat2_rad = deg_to_rad(lat2);
  double delta_lat = lat2_rad - lat1_rad;
  double delta_lon = deg_to_rad(lon2 - lon1);

  double h = haversin(delta_lat) + std::cos(lat1_rad) * std::cos(lat2_rad) * haversin(delta_lon);
  // Rounding can push h slightly outside [0, 1] for antipodal points
  h = std::clamp(h, 0.0, 1.0);
  return 2.0 * EARTH_RADIUS * std::asin(std::sqrt(h));
}

inline auto distance(const point_t &a, const point_t &b) -> double
{
  return distance(a.lat, a.lon, b.lat, b.lon);
}

// Calculate initial bearing from point A to point B in degrees [0, 360)
inline auto bearing(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = deg_to_rad(lat1);
  double lat2_rad = deg_to_rad(lat2);
  double delta_lon_rad = deg_to_rad(lon2 - lon1);

  double y = std::sin(delta_lon_rad) * std::cos(lat2_rad);
  double x = std::cos(lat1_rad) * std::sin(lat2_rad) - std::sin(lat1_rad) * std::cos(lat2_rad) * std::cos(delta_lon_rad);
  double theta = std::atan2(y, x);

  // Convert to degrees and normalize to 0-360
  double bearing_deg = theta * 180.0 / PI;
  if (bearing_deg < 0.0)
    bearing_deg += 360.0;
  if (bearing_deg >= 360.0)
    bearing_deg -= 360.0;
  return bearing_deg;
}

inline auto bearing(const point_t &a, const point_t &b) -> double
{
  return bearing(a.lat, a.lon, b.lat, b.lon);
}

} // namespace geo
} // namespace gpx_profiler
