#include "core/persistence.hpp"
#include "core/time_util.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gpx_profiler
{
namespace persistence
{

namespace
{

template <typename T> auto optional_to_json(const std::optional<T> &value) -> json
{
  return value ? json(*value) : json(nullptr);
}

} // namespace

auto save_options(const std::string &filename, const profile_options_t &options) -> bool
{
  json j;
  j["x"] = to_string(options.axes.x);
  j["y"] = to_string(options.axes.y);
  j["units"] = to_string(options.units);
  j["timezone"] = options.timezone;
  j["points"] = optional_to_json(options.resample_points);
  j["action"] = to_string(options.action);
  j["image_file"] = options.image_file;

  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to write options file: " << filename << std::endl;
    return false;
  }

  file << j.dump(4);
  return true;
}

auto load_options(const std::string &filename, profile_options_t &options) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Failed to open options file: " << filename << std::endl;
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error: " << e.what() << std::endl;
    return false;
  }

  if (!j.is_object())
  {
    std::cerr << "Options file " << filename << " must hold a JSON object" << std::endl;
    return false;
  }

  try
  {
    if (j.contains("x"))
      options.axes.x = parse_axis(j["x"].get<std::string>());
    if (j.contains("y"))
      options.axes.y = parse_axis(j["y"].get<std::string>());
    if (j.contains("units"))
      options.units = parse_unit_system(j["units"].get<std::string>());
    options.timezone = j.value("timezone", options.timezone);

    if (j.contains("points"))
    {
      if (j["points"].is_null())
        options.resample_points.reset();
      else
        options.resample_points = j["points"].get<int>();
    }

    if (j.contains("action"))
      options.action = parse_output_action(j["action"].get<std::string>());
    options.image_file = j.value("image_file", options.image_file);
  }
  catch (const json::type_error &e)
  {
    std::cerr << "Options file " << filename << ": " << e.what() << std::endl;
    return false;
  }

  return true;
}

auto write_profile(std::ostream &out, const profile_t &profile) -> void
{
  json j;
  j["units"] = to_string(profile.units);
  j["timezone"] = profile.timezone.name();
  j["original_point_count"] = profile.original_point_count;
  j["resampled_point_count"] = profile.resampled_point_count;
  j["non_monotonic_steps"] = profile.non_monotonic_steps;

  json samples = json::array();
  for (const auto &sample : profile.samples)
  {
    auto local = sample.local_time();
    samples.push_back({{"time", local ? json(time_util::format_iso8601(*sample.time, sample.utc_offset)) : json(nullptr)},
                       {"elapsed", optional_to_json(sample.elapsed_sec)},
                       {"distance", sample.distance},
                       {"elevation", optional_to_json(sample.elevation)},
                       {"velocity", optional_to_json(sample.velocity)},
                       {"segment", sample.segment_index},
                       {"segment_start", sample.segment_start}});
  }
  j["samples"] = samples;

  out << j.dump(4) << std::endl;
}

} // namespace persistence
} // namespace gpx_profiler
