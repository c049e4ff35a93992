#include <boost/algorithm/string.hpp>
#include <spdlog/fmt/fmt.h>
#include <strata/common/error.hpp>
#include <strata/schedule/cron_expression.hpp>

#include <array>
#include <charconv>
#include <optional>
#include <utility>
#include <vector>

namespace strata::schedule {

namespace {

inline constexpr auto kAliases =
    std::array<std::pair<std::string_view, std::string_view>, 7>{{
        {"@yearly", "0 0 1 1 *"},
        {"@annually", "0 0 1 1 *"},
        {"@monthly", "0 0 1 * *"},
        {"@weekly", "0 0 * * 0"},
        {"@daily", "0 0 * * *"},
        {"@midnight", "0 0 * * *"},
        {"@hourly", "0 * * * *"},
    }};

inline constexpr auto kMonthNames = std::array<std::string_view, 12>{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

inline constexpr auto kWeekdayNames = std::array<std::string_view, 7>{
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

struct field_range_t final {
  std::string_view name;
  int low{};
  int high{};
  const std::string_view* names{nullptr};  // names[i] is value low + i
  std::size_t name_count{};
};

[[noreturn]] void reject(const std::string_view expression,
                         const std::string_view reason) {
  throw strata::common::configuration_error{
      fmt::format("invalid cron expression '{}': {}", expression, reason)};
}

std::optional<int> parse_value(std::string_view token,
                               const field_range_t& range) {
  auto lowered = boost::algorithm::to_lower_copy(std::string{token});
  for (std::size_t i = 0; i < range.name_count; ++i) {
    if (range.names[i] == lowered) {
      return range.low + static_cast<int>(i);
    }
  }
  auto value = int{};
  auto [end, error] =
      std::from_chars(token.data(), token.data() + token.size(), value);
  if (error != std::errc{} || end != token.data() + token.size()) {
    return std::nullopt;
  }
  return value;
}

/// Expand one field into the set of values it selects.
std::vector<int> parse_field(const std::string_view expression,
                             const std::string_view field,
                             const field_range_t& range) {
  auto values = std::vector<int>{};
  auto items = std::vector<std::string>{};
  boost::algorithm::split(items, std::string{field}, boost::is_any_of(","));
  for (const auto& item : items) {
    auto body = std::string_view{item};
    auto step = 1;
    auto slash = body.find('/');
    if (slash != std::string_view::npos) {
      auto parsed = parse_value(body.substr(slash + 1), field_range_t{});
      if (!parsed || *parsed <= 0) {
        reject(expression, fmt::format("bad step in {} field", range.name));
      }
      step = *parsed;
      body = body.substr(0, slash);
    }

    auto low = range.low;
    auto high = range.high;
    if (body != "*") {
      auto dash = body.find('-');
      auto first = parse_value(body.substr(0, dash), range);
      if (!first) {
        reject(expression, fmt::format("bad value in {} field", range.name));
      }
      low = *first;
      if (dash != std::string_view::npos) {
        auto last = parse_value(body.substr(dash + 1), range);
        if (!last) {
          reject(expression, fmt::format("bad value in {} field", range.name));
        }
        high = *last;
      } else if (slash == std::string_view::npos) {
        high = low;
      }
    }
    if (low < range.low || high > range.high || low > high) {
      reject(expression,
             fmt::format("{} field outside {}-{}", range.name, range.low,
                         range.high));
    }
    for (auto value = low; value <= high; value += step) {
      values.push_back(value);
    }
  }
  return values;
}

template <std::size_t N>
std::bitset<N> to_bits(const std::vector<int>& values) {
  auto bits = std::bitset<N>{};
  for (const auto value : values) {
    bits.set(static_cast<std::size_t>(value));
  }
  return bits;
}

}  // namespace

cron_expression cron_expression::parse(const std::string_view expression) {
  auto text = boost::algorithm::trim_copy(std::string{expression});
  for (const auto& [alias, replacement] : kAliases) {
    if (boost::algorithm::iequals(text, alias)) {
      text = std::string{replacement};
      break;
    }
  }

  auto fields = std::vector<std::string>{};
  boost::algorithm::split(fields, text, boost::is_space(),
                          boost::token_compress_on);
  if (fields.size() != 5) {
    reject(expression, "expected five fields");
  }

  auto result = cron_expression{};
  result.source_ = std::string{expression};
  result.minutes_ = to_bits<60>(parse_field(
      expression, fields[0], field_range_t{.name = "minute", .high = 59}));
  result.hours_ = to_bits<24>(parse_field(
      expression, fields[1], field_range_t{.name = "hour", .high = 23}));
  result.days_ = to_bits<32>(parse_field(
      expression, fields[2],
      field_range_t{.name = "day-of-month", .low = 1, .high = 31}));
  result.months_ = to_bits<13>(parse_field(
      expression, fields[3],
      field_range_t{.name = "month",
                    .low = 1,
                    .high = 12,
                    .names = kMonthNames.data(),
                    .name_count = kMonthNames.size()}));
  auto weekdays = parse_field(
      expression, fields[4],
      field_range_t{.name = "day-of-week",
                    .high = 7,
                    .names = kWeekdayNames.data(),
                    .name_count = kWeekdayNames.size()});
  for (auto& weekday : weekdays) {
    weekday %= 7;
  }
  result.weekdays_ = to_bits<7>(weekdays);
  result.days_restricted_ = !fields[2].starts_with('*');
  result.weekdays_restricted_ = !fields[4].starts_with('*');

  if (!result.can_fire()) {
    reject(expression, "no date ever matches");
  }
  return result;
}

bool cron_expression::matches_day(const boost::gregorian::date& date) const {
  if (!months_.test(date.month().as_number())) {
    return false;
  }
  auto day = days_.test(date.day().as_number());
  auto weekday = weekdays_.test(date.day_of_week().as_number());
  if (days_restricted_ && weekdays_restricted_) {
    return day || weekday;
  }
  return day && weekday;
}

bool cron_expression::matches(const boost::posix_time::ptime& local) const {
  auto time = local.time_of_day();
  return matches_day(local.date()) && hours_.test(time.hours()) &&
         minutes_.test(time.minutes());
}

bool cron_expression::can_fire() const {
  // Any restricted weekday occurs in every month.
  if (weekdays_restricted_) {
    return months_.any();
  }
  constexpr auto kLongestMonth =
      std::array<int, 13>{0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  for (auto month = 1; month <= 12; ++month) {
    if (!months_.test(month)) {
      continue;
    }
    for (auto day = 1; day <= kLongestMonth[month]; ++day) {
      if (days_.test(day)) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace strata::schedule
