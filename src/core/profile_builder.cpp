#include "profile_builder.hpp"
#include "geo_math.hpp"
#include <iostream>

namespace gpx_profiler
{

auto profile_builder_t::build(const track_t &track) const -> profile_t
{
  profile_t profile;
  profile.original_point_count = track.point_count();
  profile.samples.reserve(profile.original_point_count);

  const auto track_start = first_timestamp(track);
  double distance = 0.0;

  for (size_t seg_idx = 0; seg_idx < track.segments.size(); ++seg_idx)
  {
    const auto &segment = track.segments[seg_idx];
    for (size_t i = 0; i < segment.size(); ++i)
    {
      const point_t &point = segment[i];

      sample_t sample;
      sample.segment_index = static_cast<int>(seg_idx);
      sample.elevation = point.elevation;
      sample.time = point.time;
      if (point.time && track_start)
        sample.elapsed_sec = time_util::seconds_between(*track_start, *point.time);

      if (i == 0)
      {
        // New segment: no distance or velocity across the gap
        sample.segment_start = true;
      }
      else
      {
        const point_t &prev = segment[i - 1];
        double step = geo::distance(prev, point);
        distance += step;

        if (point.time && prev.time)
        {
          double dt = time_util::seconds_between(*prev.time, *point.time);
          if (dt < 0.0)
          {
            ++profile.non_monotonic_steps;
            std::cerr << "ProfileBuilder: timestamp goes backwards in segment " << seg_idx << " at point " << i << " ("
                      << time_util::format_iso8601(*prev.time) << " -> " << time_util::format_iso8601(*point.time) << ")" << std::endl;
          }
          if (dt != 0.0)
            sample.velocity = step / dt;
        }
      }

      sample.distance = distance;
      profile.samples.push_back(sample);
    }
  }

  profile.resampled_point_count = profile.samples.size();
  return profile;
}

auto profile_builder_t::first_timestamp(const track_t &track) -> std::optional<time_point_t>
{
  for (const auto &segment : track.segments)
    for (const auto &point : segment)
      if (point.time)
        return point.time;
  return std::nullopt;
}

} // namespace gpx_profiler
