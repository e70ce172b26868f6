#include "../core/errors.hpp"
#include "../core/pipeline.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>

using namespace gpx_profiler;

namespace
{

// n points per segment, 0.001 deg of longitude (~111 m) and 10 s apart
std::string make_gpx(int segments, int points_per_segment, bool with_time, bool with_ele)
{
  std::ostringstream gpx;
  gpx << "<?xml version=\"1.0\"?>\n<gpx version=\"1.1\" xmlns=\"http://www.topografix.com/GPX/1/1\">\n<trk>\n";
  int n = 0;
  for (int s = 0; s < segments; ++s)
  {
    gpx << "<trkseg>\n";
    for (int i = 0; i < points_per_segment; ++i, ++n)
    {
      gpx << "<trkpt lat=\"0\" lon=\"" << 0.001 * n << "\">";
      if (with_ele)
        gpx << "<ele>" << 100 + n << "</ele>";
      if (with_time)
      {
        int minutes = n * 10 / 60;
        int seconds = n * 10 % 60;
        gpx << "<time>2020-06-01T10:" << (minutes < 10 ? "0" : "") << minutes << ":" << (seconds < 10 ? "0" : "") << seconds << "Z</time>";
      }
      gpx << "</trkpt>\n";
    }
    gpx << "</trkseg>\n";
  }
  gpx << "</trk>\n</gpx>\n";
  return gpx.str();
}

template <typename Error, typename Fn> bool throws(Fn fn)
{
  try
  {
    fn();
  }
  catch (const Error &e)
  {
    std::cout << "  Raised: " << e.what() << std::endl;
    return true;
  }
  return false;
}

} // namespace

void test_default_run()
{
  std::cout << "Testing distance/elevation profile with defaults..." << std::endl;
  profile_options_t options;
  profile_t profile = profile_pipeline_t(options).run(make_gpx(2, 5, true, true));

  assert(profile.samples.size() == 10);
  assert(profile.units == unit_system_t::Metric);
  assert(profile.timezone.is_utc());
  assert(profile.original_point_count == 10);
  assert(profile.samples[5].segment_start);

  // 8 steps of 0.001 deg, the jump between segments is not counted
  double step = 0.001 * 111194.93;
  assert(std::abs(profile.samples.back().distance - 8 * step) < 1.0);
  assert(std::abs(*profile.samples[1].velocity - step / 10.0) < 0.1);
}

void test_missing_data()
{
  std::cout << "Testing axes that need missing data..." << std::endl;
  const std::string no_time = make_gpx(1, 5, false, true);
  const std::string no_ele = make_gpx(1, 5, true, false);

  profile_options_t velocity;
  velocity.axes.y = axis_t::Velocity;
  assert(throws<missing_data_error_t>([&] { profile_pipeline_t(velocity).run(no_time); }));

  profile_options_t by_time;
  by_time.axes.x = axis_t::Time;
  assert(throws<missing_data_error_t>([&] { profile_pipeline_t(by_time).run(no_time); }));

  profile_options_t elevation;
  assert(throws<missing_data_error_t>([&] { profile_pipeline_t(elevation).run(no_ele); }));

  // Distance/elevation does not need timestamps
  profile_t profile = profile_pipeline_t(elevation).run(no_time);
  assert(profile.samples.size() == 5);
  assert(!profile.samples[3].velocity);
  assert(!profile.samples[3].elapsed_sec);
}

void test_empty_track()
{
  std::cout << "Testing empty track..." << std::endl;
  profile_options_t options;
  options.axes.y = axis_t::Velocity;
  options.resample_points = 10;

  profile_pipeline_t pipeline(options);
  assert(pipeline.run(std::string("<gpx version=\"1.1\"></gpx>")).empty());
  assert(pipeline.run(make_gpx(3, 0, true, true)).empty());
}

void test_invalid_options()
{
  std::cout << "Testing invalid options..." << std::endl;

  profile_options_t zero_points;
  zero_points.resample_points = 0;
  assert(throws<invalid_argument_error_t>([&] { profile_pipeline_t pipeline(zero_points); }));

  profile_options_t bad_zone;
  bad_zone.timezone = "Mars/Olympus_Mons";
  assert(throws<invalid_argument_error_t>([&] { profile_pipeline_t pipeline(bad_zone); }));

  profile_options_t bad_axis;
  bad_axis.axes.x = axis_t::Velocity;
  assert(throws<invalid_argument_error_t>([&] { profile_pipeline_t pipeline(bad_axis); }));

  assert(throws<invalid_argument_error_t>([] { parse_axis("speed"); }));
  assert(throws<invalid_argument_error_t>([] { parse_unit_system("furlongs"); }));
  assert(parse_axis("alt") == axis_t::Elevation);
  assert(parse_axis("d") == axis_t::Distance);
  assert(parse_axis("vel") == axis_t::Velocity);
  assert(parse_axis("t") == axis_t::Time);
}

void test_parse_errors_propagate()
{
  std::cout << "Testing parse errors..." << std::endl;
  profile_options_t options;
  assert(throws<parse_error_t>([&] { profile_pipeline_t(options).run(std::string("<gpx><trk><trkseg>")); }));
}

void test_resample_and_convert()
{
  std::cout << "Testing resampled imperial profile in a timezone..." << std::endl;
  const std::string gpx = make_gpx(2, 50, true, true);

  profile_options_t full_options;
  profile_t full = profile_pipeline_t(full_options).run(gpx);

  profile_options_t options;
  options.units = unit_system_t::Imperial;
  options.timezone = "+02:00";
  options.resample_points = 20;
  profile_t profile = profile_pipeline_t(options).run(gpx);

  assert(profile.units == unit_system_t::Imperial);
  assert(profile.original_point_count == 100);
  assert(profile.resampled_point_count == profile.samples.size());
  assert(profile.samples.size() < 100);
  assert(profile.samples.front().segment_start);
  assert(profile.samples.front().utc_offset == std::chrono::hours{2});

  // Distance of the last sample is the full-track distance, in miles
  double miles = full.samples.back().distance * 0.621371192 / 1000.0;
  assert(std::abs(profile.samples.back().distance - miles) < 1e-9);

  int starts = 0;
  for (const auto &sample : profile.samples)
    starts += sample.segment_start ? 1 : 0;
  assert(starts == 2);
}

int main()
{
  test_default_run();
  test_missing_data();
  test_empty_track();
  test_invalid_options();
  test_parse_errors_propagate();
  test_resample_and_convert();
  std::cout << "Pipeline Verification Passed" << std::endl;
  return 0;
}
