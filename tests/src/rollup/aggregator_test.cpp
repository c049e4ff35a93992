#include <gtest/gtest.h>
#include <strata/common/error.hpp>
#include <strata/counters/counter_store.hpp>
#include <strata/rollup/aggregator.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/schema/key/counter_keys.hpp>
#include <strata/testing/storage_fixture.hpp>

#include <atomic>
#include <numeric>
#include <thread>
#include <vector>

namespace {

namespace calendar = strata::schema::calendar;
using strata::schema::counter_tier_t;
using strata::schema::counter_type_t;
using strata::schema::period_token_t;

strata::schema::count_t total_mass(const strata::counters::counter_store& store,
                                   const strata::schema::subject_id_t subject,
                                   const strata::schema::scope_id_t scope) {
  auto snapshot = store.snapshot(subject, scope);
  auto sum = strata::schema::count_t{};
  for (const auto& row : snapshot.fine) {
    sum += row.count;
  }
  for (const auto& row : snapshot.medium) {
    sum += row.count;
  }
  for (const auto& row : snapshot.total) {
    sum += row.count;
  }
  return sum;
}

class aggregator_test : public ::testing::Test {
 protected:
  aggregator_test()
      : fixture_{"strata_aggregator"},
        store_{fixture_.encoder(), fixture_.storage(), "strata"},
        aggregator_{fixture_.encoder(), fixture_.storage(), "strata",
                    [] { return calendar::make_timestamp(2024, 6, 15, 12); }} {}

  strata::testing::storage_fixture fixture_;
  strata::counters::counter_store store_;
  strata::rollup::aggregator aggregator_;
};

}  // namespace

TEST(rollup_window, month_and_year_windows_are_the_previous_period) {
  auto now = calendar::make_timestamp(2024, 6, 15, 12);
  auto [month_start, month_end] =
      strata::rollup::rollup_window(period_token_t::month, now);
  EXPECT_EQ(month_start, calendar::make_timestamp(2024, 5, 1, 8));
  EXPECT_EQ(month_end, calendar::make_timestamp(2024, 6, 1, 8));
  auto [year_start, year_end] =
      strata::rollup::rollup_window(period_token_t::year, now);
  EXPECT_EQ(year_start, calendar::make_timestamp(2023, 1, 1, 8));
  EXPECT_EQ(year_end, calendar::make_timestamp(2024, 1, 1, 8));
}

TEST(rollup_window, first_hours_of_a_month_still_belong_to_the_last_one) {
  auto [start, end] = strata::rollup::rollup_window(
      period_token_t::month, calendar::make_timestamp(2024, 6, 1, 7));
  EXPECT_EQ(start, calendar::make_timestamp(2024, 4, 1, 8));
  EXPECT_EQ(end, calendar::make_timestamp(2024, 5, 1, 8));
}

TEST_F(aggregator_test, month_rollup_moves_last_month_into_medium) {
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 2, 9), 3);
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 20, 9), 4);
  store_.increment(1, 10, counter_type_t::hunt, calendar::make_timestamp(2024, 5, 20, 9), 1);
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 6, 2, 9), 5);
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 4, 30, 9), 6);

  auto report = aggregator_.aggregate("month");

  EXPECT_EQ(report.token, period_token_t::month);
  EXPECT_EQ(report.window_start, calendar::make_timestamp(2024, 5, 1, 8));
  EXPECT_EQ(report.groups, 2u);
  EXPECT_EQ(report.rows_deleted, 3u);
  EXPECT_EQ(report.mass_moved, 8u);

  auto medium = store_.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 2u);
  EXPECT_EQ(medium[0].type, counter_type_t::count);
  EXPECT_EQ(medium[0].count, 7u);
  EXPECT_EQ(medium[0].month_bucket, calendar::make_timestamp(2024, 5, 1, 8));
  EXPECT_EQ(medium[1].type, counter_type_t::hunt);
  EXPECT_EQ(medium[1].count, 1u);

  // June and April stay in the fine tier.
  EXPECT_EQ(store_.fine_rows(1, 10).size(), 2u);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2024, 5, 1, 8)),
            counter_tier_t::medium);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2024, 6, 1, 8)),
            counter_tier_t::fine);
  EXPECT_EQ(total_mass(store_, 1, 10), 19u);
}

TEST_F(aggregator_test, second_month_rollup_is_a_no_op) {
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 2, 9), 3);
  aggregator_.aggregate(period_token_t::month);
  auto again = aggregator_.aggregate(period_token_t::month);

  EXPECT_EQ(again.groups, 0u);
  EXPECT_EQ(again.rows_deleted, 0u);
  EXPECT_EQ(again.mass_moved, 0u);
  auto medium = store_.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].count, 3u);
}

TEST_F(aggregator_test, late_increment_lands_in_the_promoted_tier) {
  auto may = calendar::make_timestamp(2024, 5, 2, 9);
  store_.increment(1, 10, counter_type_t::count, may, 3);
  aggregator_.aggregate(period_token_t::month);

  store_.increment(1, 10, counter_type_t::count, may, 2);

  EXPECT_TRUE(store_.fine_rows(1, 10).empty());
  auto medium = store_.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].count, 5u);
}

TEST_F(aggregator_test, year_rollup_moves_medium_rows_into_total) {
  auto march_2023 = calendar::make_timestamp(2023, 3, 10, 12);
  store_.increment(1, 10, counter_type_t::count, march_2023, 4);
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2023, 4, 1, 12));
  auto july_2023 = calendar::make_timestamp(2023, 7, 10, 12);
  store_.increment(1, 10, counter_type_t::count, july_2023, 6);
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2023, 8, 1, 12));
  // Still fine: its monthly rollup never ran.
  store_.increment(1, 10, counter_type_t::count,
                   calendar::make_timestamp(2023, 11, 10, 12), 1);
  ASSERT_EQ(store_.medium_rows(1, 10).size(), 2u);

  auto report = aggregator_.aggregate("year");

  EXPECT_EQ(report.groups, 1u);
  EXPECT_EQ(report.rows_deleted, 2u);
  EXPECT_EQ(report.mass_moved, 10u);
  EXPECT_TRUE(store_.medium_rows(1, 10).empty());
  auto total = store_.total_rows(1, 10);
  ASSERT_EQ(total.size(), 1u);
  EXPECT_EQ(total[0].count, 10u);
  EXPECT_EQ(store_.fine_rows(1, 10).size(), 1u);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2023, 3, 1, 8)),
            counter_tier_t::total);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2023, 11, 1, 8)),
            counter_tier_t::fine);

  store_.increment(1, 10, counter_type_t::count, march_2023, 5);
  EXPECT_EQ(store_.total_rows(1, 10)[0].count, 15u);

  auto again = aggregator_.aggregate("year");
  EXPECT_EQ(again.mass_moved, 0u);
  EXPECT_EQ(total_mass(store_, 1, 10), 16u);
}

TEST_F(aggregator_test, year_rollup_leaves_months_before_counting_began_in_medium) {
  auto november_2017 = calendar::make_timestamp(2017, 11, 20, 12);
  auto march_2018 = calendar::make_timestamp(2018, 3, 5, 12);
  store_.increment(1, 10, counter_type_t::count, november_2017, 3);
  store_.increment(1, 10, counter_type_t::count, march_2018, 5);
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2017, 12, 1, 12));
  aggregator_.aggregate(period_token_t::month,
                        calendar::make_timestamp(2018, 4, 1, 12));

  auto early = aggregator_.aggregate(period_token_t::year,
                                     calendar::make_timestamp(2018, 2, 1, 12));
  EXPECT_EQ(early.mass_moved, 0u);
  auto report = aggregator_.aggregate(period_token_t::year,
                                      calendar::make_timestamp(2019, 2, 1, 12));
  EXPECT_EQ(report.mass_moved, 5u);

  auto medium = store_.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].month_bucket, calendar::make_timestamp(2017, 11, 1, 8));
  EXPECT_EQ(medium[0].count, 3u);
  ASSERT_EQ(store_.total_rows(1, 10).size(), 1u);
  EXPECT_EQ(store_.total_rows(1, 10)[0].count, 5u);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2017, 11, 1, 8)),
            counter_tier_t::medium);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2018, 3, 1, 8)),
            counter_tier_t::total);
}

TEST_F(aggregator_test, unknown_token_is_rejected_before_any_write) {
  store_.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 2, 9), 3);
  EXPECT_THROW(aggregator_.aggregate("week"),
               strata::common::configuration_error);
  EXPECT_THROW(aggregator_.aggregate(""), strata::common::configuration_error);
  EXPECT_EQ(store_.fine_rows(1, 10).size(), 1u);
  EXPECT_EQ(store_.tier_of(calendar::make_timestamp(2024, 5, 1, 8)),
            counter_tier_t::fine);
}

TEST(aggregator, concurrent_increments_are_conserved_across_a_rollup) {
  auto fixture = strata::testing::storage_fixture{
      "strata_aggregator_race",
      strata::storage::storage_options{.lock_timeout_ms = 5000,
                                       .transaction_timeout_ms = 10000}};
  auto store = strata::counters::counter_store{fixture.encoder(),
                                               fixture.storage(), "strata"};
  auto aggregator = strata::rollup::aggregator{
      fixture.encoder(), fixture.storage(), "strata",
      [] { return calendar::make_timestamp(2024, 6, 15, 12); }};
  constexpr auto kThreads = 4;
  constexpr auto kIncrements = 40;

  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (auto i = 0; i < kIncrements; ++i) {
        store.increment(1, 10, counter_type_t::count,
                        calendar::make_timestamp(2024, 5, 1 + ((t + i) % 28), 12));
      }
    });
  }
  auto rollups = std::vector<strata::schema::rollup_report_t>{};
  for (auto i = 0; i < 5; ++i) {
    rollups.push_back(aggregator.aggregate(period_token_t::month));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  aggregator.aggregate(period_token_t::month);

  EXPECT_TRUE(store.fine_rows(1, 10).empty());
  auto medium = store.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].count,
            static_cast<strata::schema::count_t>(kThreads * kIncrements));
}

TEST(aggregator, failed_rollup_leaves_no_trace_and_a_rerun_moves_mass_once) {
  auto fixture = strata::testing::storage_fixture{
      "strata_aggregator_rollback",
      strata::storage::storage_options{.lock_timeout_ms = 100,
                                       .transaction_timeout_ms = 10000}};
  auto store = strata::counters::counter_store{fixture.encoder(),
                                               fixture.storage(), "strata"};
  auto aggregator = strata::rollup::aggregator{
      fixture.encoder(), fixture.storage(), "strata",
      [] { return calendar::make_timestamp(2024, 6, 15, 12); }};
  auto may = calendar::make_timestamp(2024, 5, 1, 8);
  store.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 2, 9), 3);
  store.increment(1, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 9, 9), 4);
  store.increment(2, 10, counter_type_t::count, calendar::make_timestamp(2024, 5, 9, 9), 5);

  // Subject 1's destination row is held by another writer, so the rollup
  // fails after staging deletes for every fine row of the window.
  fixture.storage().transact([&](strata::storage::transaction<
                                  strata::storage::rocksdb_storage_tag>& other) {
    other.get_for_update(strata::schema::key::make_medium_key(
        "strata", 1, 10, counter_type_t::count, may));
    EXPECT_THROW(aggregator.aggregate("month"),
                 strata::common::transient_store_error);
  });

  EXPECT_EQ(store.fine_rows(1, 10).size(), 2u);
  EXPECT_EQ(store.fine_rows(2, 10).size(), 1u);
  EXPECT_TRUE(store.medium_rows(1, 10).empty());
  EXPECT_TRUE(store.medium_rows(2, 10).empty());
  EXPECT_EQ(store.tier_of(may), counter_tier_t::fine);

  auto report = aggregator.aggregate("month");
  EXPECT_EQ(report.mass_moved, 12u);
  EXPECT_EQ(report.rows_deleted, 3u);
  auto medium = store.medium_rows(1, 10);
  ASSERT_EQ(medium.size(), 1u);
  EXPECT_EQ(medium[0].count, 7u);
  EXPECT_EQ(total_mass(store, 1, 10), 7u);
  EXPECT_EQ(total_mass(store, 2, 10), 5u);
  EXPECT_EQ(store.tier_of(may), counter_tier_t::medium);

  EXPECT_EQ(aggregator.aggregate("month").mass_moved, 0u);
  EXPECT_EQ(total_mass(store, 1, 10), 7u);
}
