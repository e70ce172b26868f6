#include "resampler.hpp"
#include "errors.hpp"

namespace gpx_profiler
{

resampler_t::resampler_t(int target_points) : m_target_points(target_points) { validate_target(target_points); }

auto resampler_t::validate_target(int target_points) -> void
{
  if (target_points <= 0)
    throw invalid_argument_error_t("resample target must be positive, got " + std::to_string(target_points));
}

auto resampler_t::stride_for(size_t sample_count) const -> size_t
{
  size_t target = static_cast<size_t>(m_target_points);
  if (sample_count <= target)
    return 1;
  return (sample_count + target - 1) / target;
}

auto resampler_t::resample(const profile_t &profile) const -> profile_t
{
  const auto &samples = profile.samples;
  if (samples.size() <= static_cast<size_t>(m_target_points))
    return profile;

  const size_t stride = stride_for(samples.size());

  profile_t reduced;
  reduced.units = profile.units;
  reduced.timezone = profile.timezone;
  reduced.original_point_count = profile.original_point_count;
  reduced.non_monotonic_steps = profile.non_monotonic_steps;
  reduced.samples.reserve(samples.size() / stride + 2);

  for (size_t i = 0; i < samples.size(); ++i)
  {
    bool last = i + 1 == samples.size();
    bool segment_end = last || samples[i + 1].segment_start;
    if (i % stride == 0 || samples[i].segment_start || segment_end)
      reduced.samples.push_back(samples[i]);
  }

  reduced.resampled_point_count = reduced.samples.size();
  return reduced;
}

} // namespace gpx_profiler
