#include "../core/geo_math.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace gpx_profiler;

void test_one_degree_on_equator()
{
  std::cout << "Testing 1 degree of longitude on the equator..." << std::endl;
  double d = geo::distance(0.0, 0.0, 0.0, 1.0);
  std::cout << "  Distance: " << d << " m (Expected ~111195)" << std::endl;
  assert(std::abs(d - 111195.0) < 50.0);
}

void test_coincident_and_symmetric()
{
  std::cout << "Testing coincident points and symmetry..." << std::endl;
  std::vector<point_t> points = {{0.0, 0.0}, {47.644548, -122.326897}, {-33.8688, 151.2093}, {89.9999, 179.9999}, {-90.0, -180.0}};

  for (const auto &a : points)
  {
    double self = geo::distance(a, a);
    assert(self == 0.0);
    assert(!std::isnan(self));

    for (const auto &b : points)
    {
      double ab = geo::distance(a, b);
      double ba = geo::distance(b, a);
      assert(ab == ba);
      assert(ab >= 0.0);
    }
  }
}

void test_antipodal()
{
  std::cout << "Testing antipodal points..." << std::endl;
  double half_circumference = geo::PI * geo::EARTH_RADIUS;

  double equator = geo::distance(0.0, 0.0, 0.0, 180.0);
  double poles = geo::distance(90.0, 0.0, -90.0, 0.0);
  std::cout << "  Equator: " << equator << " m, Poles: " << poles << " m (Expected ~" << half_circumference << ")" << std::endl;

  assert(!std::isnan(equator));
  assert(!std::isnan(poles));
  assert(std::abs(equator - half_circumference) < 1.0);
  assert(std::abs(poles - half_circumference) < 1.0);
}

void test_elevation_ignored()
{
  std::cout << "Testing elevation does not affect horizontal distance..." << std::endl;
  point_t low{45.0, 7.0, 0.0};
  point_t high{45.001, 7.0, 2000.0};
  point_t flat{45.001, 7.0};
  assert(geo::distance(low, high) == geo::distance(low, flat));
}

void test_bearing()
{
  std::cout << "Testing bearings..." << std::endl;
  assert(std::abs(geo::bearing(0.0, 0.0, 1.0, 0.0) - 0.0) < 1e-9);
  assert(std::abs(geo::bearing(0.0, 0.0, 0.0, 1.0) - 90.0) < 1e-9);
  assert(std::abs(geo::bearing(0.0, 0.0, -1.0, 0.0) - 180.0) < 1e-9);
  assert(std::abs(geo::bearing(0.0, 0.0, 0.0, -1.0) - 270.0) < 1e-9);

  double b = geo::bearing(point_t{51.5, -0.12}, point_t{48.85, 2.35});
  std::cout << "  London -> Paris: " << b << " deg" << std::endl;
  assert(b > 140.0 && b < 160.0);
}

int main()
{
  test_one_degree_on_equator();
  test_coincident_and_symmetric();
  test_antipodal();
  test_elevation_ignored();
  test_bearing();
  std::cout << "Geo Math Verification Passed" << std::endl;
  return 0;
}
