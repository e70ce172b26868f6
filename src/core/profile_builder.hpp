#pragma once

#include "profile.hpp"
#include "track.hpp"

namespace gpx_profiler
{

// Walks the track segments and derives cumulative distance and velocity per point.
// Output is always metric, UTC.
class profile_builder_t
{
public:
  profile_builder_t() = default;
  ~profile_builder_t() = default;

  auto build(const track_t &track) const -> profile_t;

private:
  static auto first_timestamp(const track_t &track) -> std::optional<time_point_t>;
};

} // namespace gpx_profiler
