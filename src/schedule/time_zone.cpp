#include <boost/make_shared.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/schedule/time_zone.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <regex>

namespace strata::schedule {

namespace {

namespace local_time = boost::local_time;
namespace posix_time = boost::posix_time;

const auto kUnixEpoch =
    posix_time::ptime{boost::gregorian::date{1970, 1, 1}};
constexpr auto kMaxOffsetMinutes = 14 * 60;
constexpr auto kHourSeconds = 60 * 60;

// std name, offset hours[:mm[:ss]], then optionally a dst name with its own
// offset and the two transition rules. Offsets count hours west of UTC.
const auto kPosixPattern = std::regex{
    R"(^([A-Za-z]{3,})([+-]?)(\d{1,2})(?::(\d{2}))?(?::(\d{2}))?)"
    R"((?:([A-Za-z]{3,})(?:([+-]?)(\d{1,2})(?::(\d{2}))?(?::(\d{2}))?)?)?)"
    R"((?:,([^,]+),([^,]+))?$)"};
// Optional UTC/GMT prefix, sign, hours, optional [:]minutes.
const auto kOffsetPattern =
    std::regex{R"(^(?:UTC|GMT)?([+-])(\d{1,2})(?::?(\d{2}))?$)",
               std::regex::icase};
// Area/Location[/Sublocation], as in the IANA database.
const auto kRegionPattern =
    std::regex{R"(^[A-Za-z_]+(?:/[A-Za-z0-9_+-]+)+$)"};

struct region_registry final {
  std::mutex mutex;
  local_time::tz_database database;
  bool loaded{false};
};

region_registry& regions() {
  static auto registry = region_registry{};
  return registry;
}

std::string upper(std::string_view value) {
  auto out = std::string{value};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](unsigned char c) { return std::toupper(c); });
  return out;
}

time_zone_t make_zone(const std::string& boost_posix) {
  return time_zone_t{
      .canonical = boost_posix,
      .zone = boost::make_shared<local_time::posix_time_zone>(boost_posix)};
}

time_zone_t make_fixed_offset(const bool negative,
                              const int hours,
                              const int minutes,
                              const std::string_view original) {
  if (minutes >= 60 || hours * 60 + minutes > kMaxOffsetMinutes) {
    throw strata::common::configuration_error{
        fmt::format("timezone offset out of range: '{}'", original)};
  }
  if (hours == 0 && minutes == 0) {
    return make_zone("UTC+00");
  }
  return make_zone(fmt::format("UTC{}{:02}:{:02}", negative ? '-' : '+', hours,
                               minutes));
}

// Seconds west of UTC from the sign/hh/mm/ss groups starting at `first`.
int posix_offset_seconds(const std::smatch& match, const std::size_t first) {
  auto minutes = match[first + 2].matched ? std::stoi(match[first + 2]) : 0;
  auto seconds = match[first + 3].matched ? std::stoi(match[first + 3]) : 0;
  if (minutes >= 60 || seconds >= 60) {
    throw strata::common::configuration_error{
        fmt::format("invalid POSIX offset in '{}'", match.str(0))};
  }
  auto total = std::stoi(match[first + 1]) * kHourSeconds + minutes * 60 + seconds;
  return match[first] == "-" ? -total : total;
}

// Boost writes durations as [+|-]hh:mm[:ss].
std::string boost_duration(const int seconds) {
  auto magnitude = std::abs(seconds);
  auto out = fmt::format("{}{:02}:{:02}", seconds < 0 ? '-' : '+',
                         magnitude / kHourSeconds,
                         magnitude % kHourSeconds / 60);
  if (magnitude % 60 != 0) {
    out += fmt::format(":{:02}", magnitude % 60);
  }
  return out;
}

// Rewrites a POSIX TZ string (offsets west of UTC) into the form
// local_time::posix_time_zone reads (offset east of UTC, DST as an
// adjustment).
std::string to_boost_posix(const std::smatch& match) {
  auto standard = posix_offset_seconds(match, 2);
  auto out = fmt::format("{}{}", match.str(1), boost_duration(-standard));

  auto has_dst = match[6].matched;
  auto has_rules = match[11].matched;
  if (has_dst != has_rules) {
    throw strata::common::configuration_error{fmt::format(
        "POSIX timezone '{}' needs both a DST name and transition rules",
        match.str(0))};
  }
  if (!has_dst) {
    return out;
  }
  auto daylight = match[8].matched ? posix_offset_seconds(match, 7)
                                   : standard - kHourSeconds;
  out += fmt::format("{}{},{},{}", match.str(6),
                     boost_duration(standard - daylight), match.str(11),
                     match.str(12));
  return out;
}

time_zone_t make_region_zone(const std::string& name) {
  auto& registry = regions();
  auto lock = std::lock_guard{registry.mutex};
  if (!registry.loaded) {
    throw strata::common::configuration_error{fmt::format(
        "timezone region '{}' needs a loaded timezone database", name)};
  }
  auto zone = registry.database.time_zone_from_region(name);
  if (!zone) {
    throw strata::common::configuration_error{
        fmt::format("unknown timezone region '{}'", name)};
  }
  return time_zone_t{.canonical = name, .zone = std::move(zone)};
}

}  // namespace

posix_time::ptime time_zone_t::to_local(
    const strata::schema::timestamp_milliseconds_t timestamp) const {
  auto utc = kUnixEpoch + posix_time::milliseconds(static_cast<int64_t>(timestamp));
  return local_time::local_date_time{utc, zone}.local_time();
}

std::optional<strata::schema::timestamp_milliseconds_t> time_zone_t::to_utc(
    const posix_time::ptime& local) const {
  auto utc = local - zone->base_utc_offset();
  switch (local_time::local_date_time::check_dst(local.date(),
                                                 local.time_of_day(), zone)) {
    case boost::date_time::invalid_time_label:
      return std::nullopt;
    case boost::date_time::is_in_dst:
    case boost::date_time::ambiguous:
      utc -= zone->dst_offset();
      break;
    case boost::date_time::is_not_in_dst:
      break;
  }
  return static_cast<strata::schema::timestamp_milliseconds_t>(
      (utc - kUnixEpoch).total_milliseconds());
}

std::size_t load_time_zone_database(const std::string& path) {
  auto database = local_time::tz_database{};
  try {
    database.load_from_file(path);
  } catch (const std::exception& e) {
    throw strata::common::configuration_error{
        fmt::format("cannot load timezone database '{}': {}", path, e.what())};
  }
  auto count = database.region_list().size();

  auto& registry = regions();
  auto lock = std::lock_guard{registry.mutex};
  registry.database = std::move(database);
  registry.loaded = true;
  spdlog::debug("Loaded {} timezone regions from {}", count, path);
  return count;
}

time_zone_t normalize_time_zone(const std::string_view value) {
  auto name = upper(value);
  if (name.empty() || name == "UTC" || name == "GMT" || name == "Z") {
    return make_zone("UTC+00");
  }

  auto text = std::string{value};
  auto match = std::smatch{};
  if (std::regex_match(text, match, kOffsetPattern)) {
    return make_fixed_offset(match[1] == "-", std::stoi(match[2]),
                             match[3].matched ? std::stoi(match[3]) : 0,
                             value);
  }
  if (std::regex_match(text, kRegionPattern)) {
    return make_region_zone(text);
  }
  if (!std::regex_match(text, match, kPosixPattern)) {
    throw strata::common::configuration_error{
        fmt::format("unrecognised timezone '{}'", value)};
  }
  auto boost_posix = to_boost_posix(match);
  try {
    return make_zone(boost_posix);
  } catch (const std::exception& e) {
    throw strata::common::configuration_error{
        fmt::format("invalid POSIX timezone '{}': {}", value, e.what())};
  }
}

}  // namespace strata::schedule
