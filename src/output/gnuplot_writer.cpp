#include "gnuplot_writer.hpp"
#include "core/errors.hpp"
#include "table_writer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace gpx_profiler
{

gnuplot_writer_t::gnuplot_writer_t(plot_axes_t axes, std::string image_file) : m_axes(axes), m_image_file(std::move(image_file))
{
  m_axes.validate();
  if (!m_image_file.empty())
    terminal_for(m_image_file);
}

auto gnuplot_writer_t::column_of(axis_t axis) -> int
{
  // Matches table_writer_t column order: time elevation distance velocity
  switch (axis)
  {
  case axis_t::Time:
    return 1;
  case axis_t::Elevation:
    return 2;
  case axis_t::Distance:
    return 3;
  case axis_t::Velocity:
    return 4;
  }
  return 1;
}

auto gnuplot_writer_t::terminal_for(const std::string &image_file) -> std::string
{
  // The name goes into a single-quoted gnuplot string, which has no escapes
  auto unsafe = [](unsigned char c) { return c == '\'' || std::iscntrl(c); };
  if (std::any_of(image_file.begin(), image_file.end(), unsafe))
    throw invalid_argument_error_t("image file name must not contain quotes or control characters: " + image_file);

  size_t dot = image_file.rfind('.');
  std::string ext = dot == std::string::npos ? std::string() : image_file.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string terminal;
  if (ext == "png")
    terminal = "png";
  else if (ext == "jpg" || ext == "jpeg")
    terminal = "jpeg";
  else if (ext == "eps")
    terminal = "post eps";
  else if (ext == "svg")
    terminal = "svg";
  else
    throw invalid_argument_error_t("unsupported file type: " + ext);

  return "set terminal " + terminal + "; set output '" + image_file + "';";
}

auto gnuplot_writer_t::write(std::ostream &out, const profile_t &profile) const -> void
{
  out << "unset key\n";
  out << "set datafile missing '?'\n";

  if (m_axes.x == axis_t::Time)
  {
    out << "set xdata time\n";
    out << "set timefmt '%Y-%m-%dT%H:%M:%S'\n";
    out << "set xlabel 'time'\n";
  }
  else
  {
    out << "set xlabel 'distance, " << table_writer_t::distance_unit(profile.units) << "'\n";
  }

  if (m_axes.y == axis_t::Elevation)
    out << "set ylabel 'elevation, " << table_writer_t::elevation_unit(profile.units) << "'\n";
  else
    out << "set ylabel 'velocity, " << table_writer_t::velocity_unit(profile.units) << "'\n";

  if (!m_image_file.empty())
    out << terminal_for(m_image_file) << "\n";

  out << "plot '-' u " << column_of(m_axes.x) << ":" << column_of(m_axes.y) << " w l\n";
  table_writer_t::write(out, profile);
  out << "e\n";
}

auto gnuplot_writer_t::script(const profile_t &profile) const -> std::string
{
  std::ostringstream ss;
  write(ss, profile);
  return ss.str();
}

} // namespace gpx_profiler
