#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <strata/schema/calendar.hpp>

namespace strata::schema::calendar {

namespace {

namespace gregorian = boost::gregorian;
namespace posix_time = boost::posix_time;

const auto kUnixEpoch = posix_time::ptime{gregorian::date{1970, 1, 1}};

posix_time::ptime to_ptime(const timestamp_milliseconds_t timestamp) {
  return kUnixEpoch +
         posix_time::milliseconds(static_cast<int64_t>(timestamp));
}

timestamp_milliseconds_t from_ptime(const posix_time::ptime& time) {
  return static_cast<timestamp_milliseconds_t>(
      (time - kUnixEpoch).total_milliseconds());
}

gregorian::date shifted_date(const timestamp_milliseconds_t timestamp) {
  return (to_ptime(timestamp) - posix_time::hours(kDayOffset.count())).date();
}

timestamp_milliseconds_t bucket_of(const gregorian::date& date) {
  return from_ptime(
      posix_time::ptime{date, posix_time::hours(kDayOffset.count())});
}

}  // namespace

timestamp_milliseconds_t day_bucket(const timestamp_milliseconds_t timestamp) {
  return bucket_of(shifted_date(timestamp));
}

timestamp_milliseconds_t week_bucket(
    const timestamp_milliseconds_t timestamp) {
  auto date = shifted_date(timestamp);
  // day_of_week: Sunday = 0 .. Saturday = 6
  auto since_monday = (date.day_of_week().as_number() + 6) % 7;
  return bucket_of(date - gregorian::days(since_monday));
}

timestamp_milliseconds_t month_bucket(
    const timestamp_milliseconds_t timestamp) {
  auto date = shifted_date(timestamp);
  return bucket_of(gregorian::date{date.year(), date.month(), 1});
}

timestamp_milliseconds_t year_bucket(const timestamp_milliseconds_t timestamp) {
  auto date = shifted_date(timestamp);
  return bucket_of(gregorian::date{date.year(), 1, 1});
}

timestamp_milliseconds_t add_days(const timestamp_milliseconds_t bucket,
                                  const int days) {
  return bucket_of(shifted_date(bucket) + gregorian::days(days));
}

timestamp_milliseconds_t add_months(const timestamp_milliseconds_t bucket,
                                    const int months) {
  auto date = shifted_date(bucket);
  auto first = gregorian::date{date.year(), date.month(), 1};
  return bucket_of(first + gregorian::months(months));
}

timestamp_milliseconds_t add_years(const timestamp_milliseconds_t bucket,
                                   const int years) {
  auto date = shifted_date(bucket);
  auto first = gregorian::date{date.year(), 1, 1};
  return bucket_of(first + gregorian::years(years));
}

timestamp_milliseconds_t make_timestamp(const int year,
                                        const int month,
                                        const int day,
                                        const int hour,
                                        const int minute,
                                        const int second) {
  auto date = gregorian::date{static_cast<unsigned short>(year),
                              static_cast<unsigned short>(month),
                              static_cast<unsigned short>(day)};
  return from_ptime(posix_time::ptime{
      date, posix_time::hours(hour) + posix_time::minutes(minute) +
                posix_time::seconds(second)});
}

std::chrono::system_clock::time_point to_time_point(
    const timestamp_milliseconds_t timestamp) {
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds{timestamp})};
}

timestamp_milliseconds_t from_time_point(
    const std::chrono::system_clock::time_point time_point) {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          time_point.time_since_epoch())
          .count());
}

std::string to_iso_string(const timestamp_milliseconds_t timestamp) {
  return posix_time::to_iso_extended_string(to_ptime(timestamp)) + "Z";
}

}  // namespace strata::schema::calendar
