#include "time_util.hpp"
#include "errors.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace gpx_profiler
{
namespace time_util
{

namespace
{

// Parses "+HH:MM", "-HHMM", "+HH"
auto parse_numeric_offset(const std::string &text, std::chrono::seconds &out_offset) -> bool
{
  static const std::regex offset_regex(R"(^([+-])(\d{1,2})(?::?(\d{2}))?$)");
  std::smatch match;
  if (!std::regex_match(text, match, offset_regex))
    return false;

  int hours = std::stoi(match[2].str());
  int minutes = match[3].matched ? std::stoi(match[3].str()) : 0;
  if (hours > 14 || minutes > 59)
    return false;

  auto offset = std::chrono::hours{hours} + std::chrono::minutes{minutes};
  out_offset = match[1].str() == "-" ? -offset : offset;
  return true;
}

} // namespace

auto parse_iso8601(const std::string &text) -> std::optional<time_point_t>
{
  std::tm tm = {};
  std::istringstream ss(text);
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail())
    return std::nullopt;

  std::string rest;
  std::getline(ss, rest);

  // Fractional seconds, any precision, truncated to milliseconds
  std::chrono::milliseconds fraction{0};
  size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.')
  {
    ++pos;
    int digits = 0;
    int millis = 0;
    while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])))
    {
      if (digits < 3)
        millis = millis * 10 + (rest[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      return std::nullopt;
    for (int i = digits; i < 3; ++i)
      millis *= 10;
    fraction = std::chrono::milliseconds{millis};
  }

  std::chrono::seconds offset{0};
  std::string designator = rest.substr(pos);
  if (!designator.empty() && designator != "Z" && !parse_numeric_offset(designator, offset))
    return std::nullopt;

  std::chrono::year_month_day ymd{std::chrono::year{tm.tm_year + 1900}, std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                                  std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
  if (!ymd.ok())
    return std::nullopt;

  auto time_of_day = std::chrono::hours{tm.tm_hour} + std::chrono::minutes{tm.tm_min} + std::chrono::seconds{tm.tm_sec};
  auto local = std::chrono::sys_days{ymd} + time_of_day - offset;
  return time_point_t{std::chrono::duration_cast<std::chrono::milliseconds>(local.time_since_epoch()) + fraction};
}

auto format_iso8601(time_point_t utc, std::chrono::seconds offset) -> std::string
{
  auto local = utc + offset;
  auto day_point = std::chrono::floor<std::chrono::days>(local);
  std::chrono::year_month_day ymd{day_point};
  std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{local - day_point};

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':' << std::setw(2) << tod.minutes().count()
      << ':' << std::setw(2) << tod.seconds().count();

  if (tod.subseconds().count() != 0)
    out << '.' << std::setw(3) << tod.subseconds().count();

  if (offset.count() == 0)
  {
    out << 'Z';
  }
  else
  {
    auto magnitude = offset < std::chrono::seconds{0} ? -offset : offset;
    auto hours = std::chrono::duration_cast<std::chrono::hours>(magnitude);
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(magnitude - hours);
    out << (offset < std::chrono::seconds{0} ? '-' : '+') << std::setw(2) << hours.count() << ':' << std::setw(2) << minutes.count();
  }
  return out.str();
}

} // namespace time_util

timezone_t::timezone_t() : m_name("UTC"), m_fixed_offset(0)
{
}

auto timezone_t::parse(const std::string &name) -> timezone_t
{
  timezone_t zone;
  zone.m_name = name;

  if (name.empty() || name == "Z" || name == "UTC" || name == "GMT")
  {
    zone.m_name = "UTC";
    return zone;
  }

  // "UTC+2", "GMT-05:30"
  std::string numeric = name;
  if (numeric.rfind("UTC", 0) == 0 || numeric.rfind("GMT", 0) == 0)
    numeric = numeric.substr(3);

  if (time_util::parse_numeric_offset(numeric, zone.m_fixed_offset))
    return zone;

#if GPX_PROFILER_HAS_TZDB
  try
  {
    zone.m_zone = std::chrono::locate_zone(name);
    return zone;
  }
  catch (const std::runtime_error &)
  {
    throw invalid_argument_error_t("unknown timezone: " + name);
  }
#else
  throw invalid_argument_error_t("unknown timezone: " + name + " (only UTC offsets are supported by this build)");
#endif
}

#if GPX_PROFILER_HAS_TZDB
auto timezone_t::offset_at(time_point_t utc) const -> std::chrono::seconds
{
  if (m_zone)
    return m_zone->get_info(std::chrono::floor<std::chrono::seconds>(utc)).offset;
  return m_fixed_offset;
}
#else
auto timezone_t::offset_at(time_point_t) const -> std::chrono::seconds { return m_fixed_offset; }
#endif

auto timezone_t::name() const -> const std::string & { return m_name; }

auto timezone_t::is_utc() const -> bool
{
#if GPX_PROFILER_HAS_TZDB
  if (m_zone)
    return false;
#endif
  return m_fixed_offset.count() == 0;
}

} // namespace gpx_profiler
