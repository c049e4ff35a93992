#include <spdlog/spdlog.h>
#include <strata/query/score_engine.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/schema/counter_tier.hpp>

namespace strata::query {

namespace {

namespace calendar = strata::schema::calendar;

bool selected(const std::optional<strata::schema::counter_type_t>& filter,
              const strata::schema::counter_type_t type) {
  return !filter || *filter == type;
}

}  // namespace

strata::schema::count_t sum_bucket(
    const strata::counters::counter_snapshot_t& snapshot,
    const bucket_t& bucket,
    const std::optional<strata::schema::counter_type_t> type) {
  auto sum = strata::schema::count_t{};
  for (const auto& row : snapshot.fine) {
    if (selected(type, row.type) && row.day_bucket >= bucket.start &&
        row.day_bucket < bucket.end) {
      sum += row.count;
    }
  }
  for (const auto& row : snapshot.medium) {
    if (!selected(type, row.type) ||
        snapshot.tier_of(row.month_bucket) !=
            strata::schema::counter_tier_t::medium) {
      continue;
    }
    auto month_end = calendar::add_months(row.month_bucket, 1);
    if (row.month_bucket >= bucket.start && month_end <= bucket.end) {
      sum += row.count;
    }
  }
  return sum;
}

strata::schema::count_t sum_all_time(
    const strata::counters::counter_snapshot_t& snapshot,
    const strata::schema::timestamp_milliseconds_t now,
    const std::optional<strata::schema::counter_type_t> type) {
  auto counted = [now](const strata::schema::timestamp_milliseconds_t bucket) {
    return bucket >= calendar::kCountingEpoch && bucket < now;
  };
  auto sum = strata::schema::count_t{};
  for (const auto& row : snapshot.fine) {
    if (selected(type, row.type) && counted(row.day_bucket)) {
      sum += row.count;
    }
  }
  for (const auto& row : snapshot.medium) {
    if (selected(type, row.type) && counted(row.month_bucket)) {
      sum += row.count;
    }
  }
  for (const auto& row : snapshot.total) {
    if (selected(type, row.type)) {
      sum += row.count;
    }
  }
  return sum;
}

score_engine::score_engine(const strata::counters::counter_store& store,
                           strata::common::clock_fn_t clock)
    : store_{store}, clock_{std::move(clock)} {}

strata::schema::score_t score_engine::get_score(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  return get_score(subject, scope, std::nullopt, clock_());
}

strata::schema::score_t score_engine::get_score(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope,
    const strata::schema::counter_type_t type) const {
  return get_score(subject, scope, type, clock_());
}

strata::schema::score_t score_engine::get_score(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope,
    const std::optional<strata::schema::counter_type_t> type,
    const strata::schema::timestamp_milliseconds_t now) const {
  auto snapshot = store_.snapshot(subject, scope);

  auto day = calendar::day_bucket(now);
  auto week = calendar::week_bucket(now);
  auto month = calendar::month_bucket(now);
  auto year = calendar::year_bucket(now);
  auto sum = [&](const strata::schema::timestamp_milliseconds_t start,
                 const strata::schema::timestamp_milliseconds_t end) {
    return sum_bucket(snapshot, bucket_t{.start = start, .end = end}, type);
  };

  auto score = strata::schema::score_t{
      .today = sum(day, calendar::add_days(day, 1)),
      .yesterday = sum(calendar::add_days(day, -1), day),
      .this_week = sum(week, calendar::add_days(week, 7)),
      .last_week = sum(calendar::add_days(week, -7), week),
      .this_month = sum(month, calendar::add_months(month, 1)),
      .last_month = sum(calendar::add_months(month, -1), month),
      .this_year = sum(year, calendar::add_years(year, 1)),
      .last_year = sum(calendar::add_years(year, -1), year),
      .all_time = sum_all_time(snapshot, now, type)};

  spdlog::debug("Score for subject {} scope {}: today={} all_time={}", subject,
                scope, score.today, score.all_time);
  return score;
}

}  // namespace strata::query
