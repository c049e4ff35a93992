#include <gtest/gtest.h>
#include <strata/counters/counter_store.hpp>
#include <strata/query/score_engine.hpp>
#include <strata/rollup/aggregator.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/testing/storage_fixture.hpp>

namespace {

namespace calendar = strata::schema::calendar;
using strata::schema::counter_tier_t;
using strata::schema::counter_type_t;
using strata::schema::period_token_t;
using strata::schema::score_t;

// Saturday; the week started on Monday 10 June.
const auto kNow = calendar::make_timestamp(2024, 6, 15, 12);
constexpr auto kHour = strata::schema::timestamp_milliseconds_t{60 * 60 * 1000};

class score_engine_test : public ::testing::Test {
 protected:
  score_engine_test()
      : fixture_{"strata_score_engine"},
        store_{fixture_.encoder(), fixture_.storage(), "strata"},
        aggregator_{fixture_.encoder(), fixture_.storage(), "strata",
                    [] { return kNow; }},
        engine_{store_, [] { return kNow; }} {}

  void add(const strata::schema::timestamp_milliseconds_t timestamp,
           const strata::schema::count_t delta,
           const counter_type_t type = counter_type_t::count) {
    store_.increment(1, 10, type, timestamp, delta);
  }

  void seed() {
    add(calendar::make_timestamp(2024, 6, 15, 9), 1);
    add(calendar::make_timestamp(2024, 6, 14, 20), 2);
    // Before 08:00 UTC, so still the 14th.
    add(calendar::make_timestamp(2024, 6, 15, 7, 59), 4);
    add(calendar::make_timestamp(2024, 6, 5, 12), 8);
    add(calendar::make_timestamp(2024, 5, 20, 12), 16);
    add(calendar::make_timestamp(2024, 2, 10, 12), 32);
    add(calendar::make_timestamp(2023, 7, 1, 12), 64);
    // Before counting began.
    add(calendar::make_timestamp(2017, 12, 31, 12), 128);
  }

  strata::testing::storage_fixture fixture_;
  strata::counters::counter_store store_;
  strata::rollup::aggregator aggregator_;
  strata::query::score_engine engine_;
};

const auto kSeededScore = score_t{.today = 1,
                                  .yesterday = 6,
                                  .this_week = 7,
                                  .last_week = 8,
                                  .this_month = 15,
                                  .last_month = 16,
                                  .this_year = 63,
                                  .last_year = 64,
                                  .all_time = 127};

}  // namespace

TEST_F(score_engine_test, empty_subject_scores_zero) {
  EXPECT_EQ(engine_.get_score(1, 10), score_t{});
}

TEST_F(score_engine_test, fine_rows_fill_every_bucket) {
  seed();
  EXPECT_EQ(engine_.get_score(1, 10), kSeededScore);
}

TEST_F(score_engine_test, month_rollups_do_not_change_whole_month_buckets) {
  seed();
  aggregator_.aggregate(period_token_t::month);
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2024, 3, 1, 12));
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2023, 8, 1, 12));
  ASSERT_EQ(store_.medium_rows(1, 10).size(), 3u);

  EXPECT_EQ(engine_.get_score(1, 10), kSeededScore);
}

TEST_F(score_engine_test, late_increment_after_rollup_is_counted_once) {
  seed();
  aggregator_.aggregate(period_token_t::month);
  add(calendar::make_timestamp(2024, 5, 21, 12), 1000);

  auto score = engine_.get_score(1, 10);
  EXPECT_EQ(score.last_month, 1016u);
  EXPECT_EQ(score.this_year, 1063u);
  EXPECT_EQ(score.all_time, 1127u);
}

TEST_F(score_engine_test, year_rollup_keeps_mass_in_all_time) {
  seed();
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2023, 8, 1, 12));
  aggregator_.aggregate(period_token_t::year);
  ASSERT_EQ(store_.total_rows(1, 10).size(), 1u);

  auto score = engine_.get_score(1, 10);
  EXPECT_EQ(score.this_year, 63u);
  EXPECT_EQ(score.last_year, 0u);
  EXPECT_EQ(score.all_time, 127u);
}

TEST_F(score_engine_test, type_filter_selects_one_counter_type) {
  seed();
  add(calendar::make_timestamp(2024, 6, 15, 10), 1000, counter_type_t::hunt);

  EXPECT_EQ(engine_.get_score(1, 10, counter_type_t::hunt),
            (score_t{.today = 1000,
                     .this_week = 1000,
                     .this_month = 1000,
                     .this_year = 1000,
                     .all_time = 1000}));
  EXPECT_EQ(engine_.get_score(1, 10, counter_type_t::count), kSeededScore);
  EXPECT_EQ(engine_.get_score(1, 10).today, 1001u);
  EXPECT_EQ(engine_.get_score(1, 10, counter_type_t::battle), score_t{});
}

TEST_F(score_engine_test, other_scopes_and_subjects_are_isolated) {
  seed();
  store_.increment(2, 10, counter_type_t::count, kNow, 500);
  store_.increment(1, 11, counter_type_t::count, kNow, 700);
  EXPECT_EQ(engine_.get_score(1, 10), kSeededScore);
  EXPECT_EQ(engine_.get_score(2, 10).today, 500u);
}

TEST_F(score_engine_test, events_relative_to_now_land_in_their_buckets) {
  add(kNow - 1 * kHour, 1);
  add(kNow - 26 * kHour, 2);
  add(kNow - 9 * 24 * kHour, 4);
  add(kNow - 40 * 24 * kHour, 8);

  EXPECT_EQ(engine_.get_score(1, 10), (score_t{.today = 1,
                                               .yesterday = 2,
                                               .this_week = 3,
                                               .last_week = 4,
                                               .this_month = 7,
                                               .last_month = 8,
                                               .this_year = 15,
                                               .all_time = 15}));
}

TEST_F(score_engine_test, explicit_instant_overrides_the_clock) {
  seed();
  auto score = engine_.get_score(1, 10, std::nullopt,
                                 calendar::make_timestamp(2024, 6, 16, 9));
  EXPECT_EQ(score.today, 0u);
  EXPECT_EQ(score.yesterday, 1u);
  EXPECT_EQ(score.this_week, 7u);
}

TEST(sum_bucket, medium_month_counts_only_when_fully_covered) {
  auto may = calendar::make_timestamp(2024, 5, 1, 8);
  auto snapshot = strata::counters::counter_snapshot_t{};
  snapshot.medium.push_back(strata::schema::medium_counter_t{
      .subject_id = 1, .scope_id = 10, .month_bucket = may, .count = 9});
  snapshot.tiers[may] = counter_tier_t::medium;

  EXPECT_EQ(strata::query::sum_bucket(
                snapshot, {.start = may, .end = calendar::add_months(may, 1)}),
            9u);
  EXPECT_EQ(strata::query::sum_bucket(
                snapshot, {.start = calendar::add_years(may, -1),
                           .end = calendar::add_years(may, 1)}),
            9u);
  EXPECT_EQ(strata::query::sum_bucket(
                snapshot, {.start = calendar::add_days(may, 7),
                           .end = calendar::add_days(may, 14)}),
            0u);
  EXPECT_EQ(strata::query::sum_bucket(
                snapshot, {.start = may, .end = calendar::add_days(may, 30)}),
            0u);
  EXPECT_EQ(strata::query::sum_all_time(snapshot, kNow), 9u);
  EXPECT_EQ(
      strata::query::sum_all_time(snapshot, kNow, counter_type_t::hunt), 0u);
}

TEST(sum_bucket, medium_row_without_a_medium_marker_is_ignored) {
  auto may = calendar::make_timestamp(2024, 5, 1, 8);
  auto snapshot = strata::counters::counter_snapshot_t{};
  snapshot.medium.push_back(strata::schema::medium_counter_t{
      .subject_id = 1, .scope_id = 10, .month_bucket = may, .count = 9});

  EXPECT_EQ(strata::query::sum_bucket(
                snapshot, {.start = may, .end = calendar::add_months(may, 1)}),
            0u);
}

TEST(sum_all_time, counts_from_the_epoch_up_to_now_in_every_tier) {
  auto snapshot = strata::counters::counter_snapshot_t{};
  auto fine = [&](const strata::schema::timestamp_milliseconds_t day,
                  const strata::schema::count_t count) {
    snapshot.fine.push_back(strata::schema::fine_counter_t{
        .subject_id = 1, .scope_id = 10, .day_bucket = day, .count = count});
  };
  auto medium = [&](const strata::schema::timestamp_milliseconds_t month,
                    const strata::schema::count_t count) {
    snapshot.medium.push_back(strata::schema::medium_counter_t{
        .subject_id = 1, .scope_id = 10, .month_bucket = month, .count = count});
  };
  fine(calendar::day_bucket(kNow), 1);
  fine(calendar::add_days(calendar::day_bucket(kNow), 2), 2);
  fine(calendar::make_timestamp(2017, 12, 30, 8), 4);
  medium(calendar::make_timestamp(2024, 5, 1, 8), 8);
  medium(calendar::make_timestamp(2017, 11, 1, 8), 16);
  medium(calendar::make_timestamp(2024, 7, 1, 8), 32);
  snapshot.total.push_back(strata::schema::total_counter_t{
      .subject_id = 1, .scope_id = 10, .count = 64});

  EXPECT_EQ(strata::query::sum_all_time(snapshot, kNow), 73u);
  EXPECT_EQ(strata::query::sum_all_time(
                snapshot, calendar::make_timestamp(2024, 7, 2, 12)),
            107u);
}
