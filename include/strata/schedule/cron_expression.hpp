#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <bitset>
#include <string>
#include <string_view>

namespace strata::schedule {

/// Five-field cron expression: minute, hour, day of month, month, day of week.
///
/// Fields accept `*`, values, `a-b` ranges, `a,b` lists and `/step`. Months
/// and weekdays also accept three-letter names; weekday 7 is Sunday. When
/// both day fields are restricted a day matches if either does.
class cron_expression final {
 public:
  /// Throws strata::common::configuration_error for a malformed expression
  /// or one that can never fire.
  static cron_expression parse(std::string_view expression);

  bool matches_day(const boost::gregorian::date& date) const;
  bool matches(const boost::posix_time::ptime& local) const;

  const std::bitset<60>& minutes() const { return minutes_; }
  const std::bitset<24>& hours() const { return hours_; }

  const std::string& source() const { return source_; }

 private:
  bool can_fire() const;

  std::string source_;
  std::bitset<60> minutes_;
  std::bitset<24> hours_;
  std::bitset<32> days_;      // 1-31
  std::bitset<13> months_;    // 1-12
  std::bitset<7> weekdays_;   // 0 = Sunday
  bool days_restricted_{false};
  bool weekdays_restricted_{false};
};

}  // namespace strata::schedule
