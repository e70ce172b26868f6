#pragma once

#include "core/pipeline.hpp"
#include "core/profile.hpp"
#include <ostream>
#include <string>

namespace gpx_profiler
{
namespace persistence
{

// Profile options as JSON:
// { "x": "distance", "y": "elevation", "units": "metric", "timezone": "UTC",
//   "points": 500, "action": "table", "image_file": "" }
// Missing keys keep the value already in options. Bad values throw invalid_argument_error_t.
auto save_options(const std::string &filename, const profile_options_t &options) -> bool;
auto load_options(const std::string &filename, profile_options_t &options) -> bool;

auto write_profile(std::ostream &out, const profile_t &profile) -> void;

} // namespace persistence
} // namespace gpx_profiler
