#pragma once

#include "core/plot_axes.hpp"
#include "core/profile.hpp"
#include <ostream>
#include <string>

namespace gpx_profiler
{

// Self-contained gnuplot script with the profile table inlined as '-' data
class gnuplot_writer_t
{
public:
  // image_file selects the terminal by extension (png, jpg/jpeg, eps, svg);
  // empty means the default interactive terminal.
  gnuplot_writer_t(plot_axes_t axes, std::string image_file = {});

  auto write(std::ostream &out, const profile_t &profile) const -> void;
  auto script(const profile_t &profile) const -> std::string;

  // "set terminal ...; set output ...;" for image_file, throws invalid_argument_error_t
  // on an unsupported extension or a name with a quote or control character
  static auto terminal_for(const std::string &image_file) -> std::string;

  // Column of the table holding the axis variable
  static auto column_of(axis_t axis) -> int;

private:
  plot_axes_t m_axes;
  std::string m_image_file;
};

} // namespace gpx_profiler
