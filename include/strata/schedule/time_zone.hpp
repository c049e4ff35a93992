#pragma once

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <strata/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace strata::schedule {

/// A timezone reduced to one canonical form: a Boost POSIX zone evaluated
/// against the proleptic Gregorian calendar.
struct time_zone_t final {
  /// An IANA region name such as "America/New_York", or a
  /// local_time::posix_time_zone string (offsets east of UTC, DST as an
  /// adjustment), e.g. "UTC+00" or "EST-05:00EDT+01:00,M3.2.0,M11.1.0".
  std::string canonical;
  boost::local_time::time_zone_ptr zone;

  /// Wall-clock time in this zone at a UTC instant.
  boost::posix_time::ptime to_local(
      strata::schema::timestamp_milliseconds_t timestamp) const;

  /// UTC instant of a local wall-clock time. std::nullopt inside a DST gap;
  /// an ambiguous time resolves to its first (DST) instant.
  std::optional<strata::schema::timestamp_milliseconds_t> to_utc(
      const boost::posix_time::ptime& local) const;
};

/// Replaces the region rules with those of a Boost date_time zonespec CSV
/// (header line, then one quoted record per region). Returns the number of
/// regions. Throws strata::common::configuration_error if the file cannot be
/// read or parsed.
std::size_t load_time_zone_database(const std::string& path);

/// Accepts "UTC", "GMT", "Z", ISO-style fixed offsets ("+08:00", "-0530",
/// "UTC+8", "GMT-03:30"), standard POSIX TZ strings ("EST5EDT,M3.2.0,M11.1.0",
/// offsets west of UTC) and region names from the loaded timezone database.
/// Throws strata::common::configuration_error for anything else.
time_zone_t normalize_time_zone(std::string_view value);

}  // namespace strata::schedule
