#include "../core/unit_converter.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace gpx_profiler;
using namespace std::chrono_literals;

namespace
{

bool close_rel(double a, double b, double rel = 1e-6)
{
  return std::abs(a - b) <= rel * std::max(std::abs(a), std::abs(b));
}

profile_t make_profile()
{
  const time_point_t t0 = *time_util::parse_iso8601("2009-10-17T18:37:26Z");

  profile_t profile;
  profile.original_point_count = 3;
  profile.resampled_point_count = 3;

  sample_t a;
  a.segment_start = true;
  a.distance = 0.0;
  a.elevation = 100.0;
  a.time = t0;
  a.elapsed_sec = 0.0;

  sample_t b;
  b.distance = 1609.344;
  b.elevation = 123.4;
  b.velocity = 10.0;
  b.time = t0 + 160s;
  b.elapsed_sec = 160.0;

  sample_t c;
  c.segment_index = 1;
  c.segment_start = true;
  c.distance = 1609.344;

  profile.samples = {a, b, c};
  return profile;
}

} // namespace

void test_metric_to_imperial()
{
  std::cout << "Testing metric -> imperial..." << std::endl;
  profile_t metric = make_profile();
  profile_t imperial = unit_converter_t(unit_system_t::Imperial, timezone_t()).convert(metric);

  assert(imperial.units == unit_system_t::Imperial);
  assert(imperial.samples.size() == 3);
  std::cout << "  1609.344 m -> " << imperial.samples[1].distance << " miles" << std::endl;
  assert(close_rel(imperial.samples[1].distance, 1.0));
  assert(close_rel(*imperial.samples[0].elevation, 328.08399));
  assert(close_rel(*imperial.samples[1].velocity, 22.369362912));
  assert(imperial.samples[0].distance == 0.0);

  // Absent stays absent
  assert(!imperial.samples[0].velocity);
  assert(!imperial.samples[2].elevation);
  assert(!imperial.samples[2].time);

  // Elapsed time is not a unit-dependent value
  assert(*imperial.samples[1].elapsed_sec == 160.0);

  // Input untouched
  assert(metric.units == unit_system_t::Metric);
  assert(metric.samples[1].distance == 1609.344);
}

void test_round_trip()
{
  std::cout << "Testing metric -> imperial -> metric round trip..." << std::endl;
  profile_t metric = make_profile();
  profile_t imperial = unit_converter_t(unit_system_t::Imperial, timezone_t()).convert(metric);
  profile_t back = unit_converter_t(unit_system_t::Metric, timezone_t()).convert(imperial);

  assert(back.units == unit_system_t::Metric);
  for (size_t i = 0; i < metric.samples.size(); ++i)
  {
    const sample_t &orig = metric.samples[i];
    const sample_t &round = back.samples[i];
    assert(orig.distance == 0.0 ? round.distance == 0.0 : close_rel(orig.distance, round.distance));
    assert(orig.elevation.has_value() == round.elevation.has_value());
    if (orig.elevation)
      assert(close_rel(*orig.elevation, *round.elevation));
    assert(orig.velocity.has_value() == round.velocity.has_value());
    if (orig.velocity)
      assert(close_rel(*orig.velocity, *round.velocity));
  }

  // Same system is an exact copy of the values
  profile_t same = unit_converter_t(unit_system_t::Metric, timezone_t()).convert(metric);
  assert(same.samples[1].distance == metric.samples[1].distance);
  assert(*same.samples[1].elevation == *metric.samples[1].elevation);
}

void test_timezone_shift()
{
  std::cout << "Testing timezone shift..." << std::endl;
  profile_t metric = make_profile();
  profile_t shifted = unit_converter_t(unit_system_t::Metric, timezone_t::parse("+03:00")).convert(metric);

  assert(shifted.timezone.name() == "+03:00");
  assert(shifted.samples[0].utc_offset == 3h);
  assert(*shifted.samples[0].local_time() == *metric.samples[0].time + 3h);
  assert(time_util::format_iso8601(*shifted.samples[1].time, shifted.samples[1].utc_offset) == "2009-10-17T21:40:06+03:00");

  // The UTC instant is kept; sample without a timestamp gets no time
  assert(*shifted.samples[0].time == *metric.samples[0].time);
  assert(!shifted.samples[2].local_time());

  // Back to UTC
  profile_t utc = unit_converter_t(unit_system_t::Metric, timezone_t()).convert(shifted);
  assert(utc.samples[0].utc_offset == 0s);
  assert(*utc.samples[0].local_time() == *metric.samples[0].time);
}

void test_structure_preserved()
{
  std::cout << "Testing count, order and segment flags..." << std::endl;
  profile_t metric = make_profile();
  profile_t imperial = unit_converter_t(unit_system_t::Imperial, timezone_t::parse("-05:00")).convert(metric);

  assert(imperial.samples.size() == metric.samples.size());
  assert(imperial.original_point_count == metric.original_point_count);
  assert(imperial.resampled_point_count == metric.resampled_point_count);
  for (size_t i = 0; i < metric.samples.size(); ++i)
  {
    assert(imperial.samples[i].segment_start == metric.samples[i].segment_start);
    assert(imperial.samples[i].segment_index == metric.samples[i].segment_index);
  }
}

int main()
{
  test_metric_to_imperial();
  test_round_trip();
  test_timezone_shift();
  test_structure_preserved();
  std::cout << "Unit Converter Verification Passed" << std::endl;
  return 0;
}
