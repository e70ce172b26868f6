#include <getopt.h>
#include <stdio.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "core/errors.hpp"
#include "core/persistence.hpp"
#include "core/pipeline.hpp"
#include "output/gnuplot_writer.hpp"
#include "output/table_writer.hpp"

namespace
{

constexpr int EXIT_EOPTION = 1;
constexpr int EXIT_EIO = 2;
constexpr int EXIT_EFORMAT = 3;
constexpr int EXIT_EDATA = 4;

constexpr const char *USAGE = R"(usage: gpx_profiler [action] [options] track.gpx

Analyze a GPS track and produce elevation and velocity profiles.
Distances use the haversine formula (spherical Earth); multi-segment tracks
are supported. Use '-' to read the track from standard input.

Actions:
-g                 plot using gnuplot
--gprint           print gnuplot script to standard output
--json             print the profile as JSON
--table            print data table (default)

Options:
-h, --help         print this message
-v                 print diagnostics on standard error
-E                 use English units (metric units used by default)
-x var             plot var = { time | distance } against x-axis
-y var             plot var = { elevation | velocity } against y-axis
-o imagefile       save plot to image file (supported: PNG, JPG, EPS, SVG)
-t tzname          use timezone tzname (e.g. 'Europe/Moscow', '+03:00')
-n N_points        reduce number of points to approximately N_points
--config file      read options from a JSON file (flags override it)
--save-config file write the effective options to a JSON file
)";

auto print_see_usage(const char *argv0) -> void
{
  std::cerr << "see usage: " << argv0 << " --help" << std::endl;
}

auto read_input(const std::string &path, std::string &out_content) -> bool
{
  if (path == "-")
  {
    out_content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    // cin reads through stdio, which keeps the error flag
    if (std::cin.bad() || ferror(stdin))
    {
      std::cerr << "Failed to read GPX data from standard input" << std::endl;
      return false;
    }
    return true;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec))
  {
    std::cerr << "GPX file is a directory: " << path << std::endl;
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    std::cerr << "Failed to open GPX file: " << path << std::endl;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  out_content = buffer.str();
  return true;
}

auto plot_in_gnuplot(const std::string &script, bool persist) -> bool
{
  FILE *pipe = popen(persist ? "gnuplot -persist" : "gnuplot", "w");
  if (pipe == NULL)
  {
    std::cerr << "Failed to start gnuplot" << std::endl;
    return false;
  }

  size_t written = fwrite(script.data(), 1, script.size(), pipe);
  int status = pclose(pipe);
  if (written != script.size())
  {
    std::cerr << "Failed to send the script to gnuplot" << std::endl;
    return false;
  }
  if (status != 0)
  {
    std::cerr << "gnuplot exited with status " << status << std::endl;
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv)
{
  using namespace gpx_profiler;

  enum long_option_t
  {
    OPT_GPRINT = 256,
    OPT_JSON,
    OPT_TABLE,
    OPT_CONFIG,
    OPT_SAVE_CONFIG
  };

  static const option long_options[] = {{"help", no_argument, nullptr, 'h'},
                                        {"gprint", no_argument, nullptr, OPT_GPRINT},
                                        {"json", no_argument, nullptr, OPT_JSON},
                                        {"table", no_argument, nullptr, OPT_TABLE},
                                        {"config", required_argument, nullptr, OPT_CONFIG},
                                        {"save-config", required_argument, nullptr, OPT_SAVE_CONFIG},
                                        {nullptr, 0, nullptr, 0}};

  profile_options_t options;
  std::string save_config_file;

  // The config file is the base layer: a quiet first pass loads every --config,
  // the second pass applies the remaining flags on top of it
  opterr = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, "hvgEx:y:o:t:n:", long_options, nullptr)) != -1)
  {
    if (opt != OPT_CONFIG)
      continue;
    try
    {
      if (!persistence::load_options(optarg, options))
        return EXIT_EOPTION;
    }
    catch (const invalid_argument_error_t &e)
    {
      std::cerr << optarg << ": " << e.what() << std::endl;
      return EXIT_EOPTION;
    }
  }
  opterr = 1;
  optind = 1;

  try
  {
    while ((opt = getopt_long(argc, argv, "hvgEx:y:o:t:n:", long_options, nullptr)) != -1)
    {
      switch (opt)
      {
      case 'h':
        std::cout << USAGE;
        return 0;
      case 'v':
        options.verbose = true;
        break;
      case 'g':
        options.action = output_action_t::Gnuplot;
        break;
      case 'E':
        options.units = unit_system_t::Imperial;
        break;
      case 'x':
        options.axes.x = parse_axis(optarg);
        break;
      case 'y':
        options.axes.y = parse_axis(optarg);
        break;
      case 'o':
        options.image_file = optarg;
        break;
      case 't':
        options.timezone = optarg;
        break;
      case 'n':
      {
        std::string text = optarg;
        size_t consumed = 0;
        int points = 0;
        try
        {
          points = std::stoi(text, &consumed);
        }
        catch (const std::exception &)
        {
          consumed = 0;
        }
        if (consumed == 0 || consumed != text.size())
        {
          std::cerr << "invalid number of points: " << text << std::endl;
          return EXIT_EOPTION;
        }
        options.resample_points = points;
        break;
      }
      case OPT_GPRINT:
        options.action = output_action_t::GnuplotScript;
        break;
      case OPT_JSON:
        options.action = output_action_t::Json;
        break;
      case OPT_TABLE:
        options.action = output_action_t::Table;
        break;
      case OPT_CONFIG:
        // Loaded in the first pass
        break;
      case OPT_SAVE_CONFIG:
        save_config_file = optarg;
        break;
      default:
        print_see_usage(argv[0]);
        return EXIT_EOPTION;
      }
    }
  }
  catch (const invalid_argument_error_t &e)
  {
    std::cerr << e.what() << std::endl;
    print_see_usage(argv[0]);
    return EXIT_EOPTION;
  }

  if (optind + 1 < argc)
  {
    std::cerr << "only one GPX file should be specified" << std::endl;
    print_see_usage(argv[0]);
    return EXIT_EOPTION;
  }
  if (optind >= argc)
  {
    std::cerr << "please provide a GPX file to process." << std::endl;
    print_see_usage(argv[0]);
    return EXIT_EOPTION;
  }

  if (!save_config_file.empty() && !persistence::save_options(save_config_file, options))
    return EXIT_EIO;

  try
  {
    profile_pipeline_t pipeline(options);
    gnuplot_writer_t plot(options.axes, options.image_file);

    std::string content;
    if (!read_input(argv[optind], content))
      return EXIT_EIO;

    profile_t profile = pipeline.run(content);

    switch (options.action)
    {
    case output_action_t::Table:
      table_writer_t::write(std::cout, profile);
      break;
    case output_action_t::GnuplotScript:
      plot.write(std::cout, profile);
      break;
    case output_action_t::Gnuplot:
      if (!plot_in_gnuplot(plot.script(profile), options.image_file.empty()))
        return EXIT_EIO;
      break;
    case output_action_t::Json:
      persistence::write_profile(std::cout, profile);
      break;
    }
  }
  catch (const invalid_argument_error_t &e)
  {
    std::cerr << e.what() << std::endl;
    return EXIT_EOPTION;
  }
  catch (const parse_error_t &e)
  {
    std::cerr << argv[optind] << ": " << e.what() << std::endl;
    return EXIT_EFORMAT;
  }
  catch (const missing_data_error_t &e)
  {
    std::cerr << argv[optind] << ": " << e.what() << std::endl;
    return EXIT_EDATA;
  }

  return 0;
}
