#pragma once

#include <strata/schema/primitives.hpp>
#include <chrono>
#include <string>

// Schema type: calendar.
// Counting workflow: Bucket arithmetic shared by ingestion, rollup and score
// queries. Every boundary sits at 08:00 UTC: a timestamp belongs to the
// calendar date of (timestamp - kDayOffset), and a bucket is identified by
// the 08:00 UTC instant on its first day.
namespace strata::schema::calendar {

inline constexpr auto kDayOffset = std::chrono::hours{8};

/// 2018-01-01T00:00:00Z, when counting began.
inline constexpr auto kCountingEpoch = timestamp_milliseconds_t{1'514'764'800'000};

/// Start of the day containing `timestamp`.
timestamp_milliseconds_t day_bucket(timestamp_milliseconds_t timestamp);

/// Start of the ISO week (Monday) containing `timestamp`.
timestamp_milliseconds_t week_bucket(timestamp_milliseconds_t timestamp);

/// Start of the calendar month containing `timestamp`.
timestamp_milliseconds_t month_bucket(timestamp_milliseconds_t timestamp);

/// Start of the calendar year containing `timestamp`.
timestamp_milliseconds_t year_bucket(timestamp_milliseconds_t timestamp);

timestamp_milliseconds_t add_days(timestamp_milliseconds_t bucket, int days);
timestamp_milliseconds_t add_months(timestamp_milliseconds_t bucket,
                                    int months);
timestamp_milliseconds_t add_years(timestamp_milliseconds_t bucket, int years);

/// Milliseconds since the Unix epoch for a UTC wall-clock instant.
timestamp_milliseconds_t make_timestamp(int year,
                                        int month,
                                        int day,
                                        int hour = 0,
                                        int minute = 0,
                                        int second = 0);

std::chrono::system_clock::time_point to_time_point(
    timestamp_milliseconds_t timestamp);
timestamp_milliseconds_t from_time_point(
    std::chrono::system_clock::time_point time_point);

/// ISO-8601 extended UTC rendering, for logs.
std::string to_iso_string(timestamp_milliseconds_t timestamp);

}  // namespace strata::schema::calendar
