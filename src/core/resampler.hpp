#pragma once

#include "profile.hpp"

namespace gpx_profiler
{

// Decimates a profile to roughly target_points samples. Segment boundaries and the
// final sample always survive, so the result may exceed the target slightly.
class resampler_t
{
public:
  explicit resampler_t(int target_points);

  auto resample(const profile_t &profile) const -> profile_t;

  // Throws invalid_argument_error_t unless target_points is positive
  static auto validate_target(int target_points) -> void;

  // Keep every stride-th sample for a profile of sample_count samples
  auto stride_for(size_t sample_count) const -> size_t;

private:
  int m_target_points;
};

} // namespace gpx_profiler
