#include "pipeline.hpp"
#include "errors.hpp"
#include "profile_builder.hpp"
#include "resampler.hpp"
#include "track_parser.hpp"
#include "unit_converter.hpp"
#include <iostream>

namespace gpx_profiler
{

auto parse_output_action(const std::string &name) -> output_action_t
{
  if (name == "table")
    return output_action_t::Table;
  if (name == "gprint")
    return output_action_t::GnuplotScript;
  if (name == "gnuplot")
    return output_action_t::Gnuplot;
  if (name == "json")
    return output_action_t::Json;
  throw invalid_argument_error_t("unknown output action: " + name);
}

auto to_string(output_action_t action) -> const char *
{
  switch (action)
  {
  case output_action_t::Table:
    return "table";
  case output_action_t::GnuplotScript:
    return "gprint";
  case output_action_t::Gnuplot:
    return "gnuplot";
  case output_action_t::Json:
    return "json";
  }
  return "table";
}

profile_pipeline_t::profile_pipeline_t(const profile_options_t &options) : m_options(options), m_timezone(timezone_t::parse(options.timezone))
{
  m_options.axes.validate();
  if (m_options.resample_points)
    resampler_t::validate_target(*m_options.resample_points);
}

auto profile_pipeline_t::run(const std::string &gpx_content) const -> profile_t
{
  track_t track = track_parser_t::parse_gpx(gpx_content);
  if (m_options.verbose)
    std::cerr << "TrackParser: " << track.segments.size() << " segments, " << track.point_count() << " points" << std::endl;
  return run(track);
}

auto profile_pipeline_t::run(const track_t &track) const -> profile_t
{
  m_options.axes.check_data(track);

  profile_builder_t builder;
  profile_t profile = builder.build(track);

  if (m_options.resample_points)
  {
    resampler_t resampler(*m_options.resample_points);
    if (m_options.verbose)
      std::cerr << "Resampler: stride " << resampler.stride_for(profile.samples.size()) << std::endl;

    profile = resampler.resample(profile);

    if (m_options.verbose)
      std::cerr << "Resampler: original " << profile.original_point_count << " pts, filtered " << profile.resampled_point_count << " pts"
                << std::endl;
  }

  unit_converter_t converter(m_options.units, m_timezone);
  return converter.convert(profile);
}

} // namespace gpx_profiler
