#include <gtest/gtest.h>
#include <strata/common/error.hpp>
#include <strata/schedule/cron.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/testing/manual_timer.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace {

namespace calendar = strata::schema::calendar;
using manual_timer_t = strata::schedule::timer<strata::testing::manual_timer_tag>;
using strata::schedule::cron_state_t;

class cron_test : public ::testing::Test {
 protected:
  cron_test()
      : clock_{std::make_shared<strata::testing::virtual_clock>(
            calendar::make_timestamp(2024, 1, 15))} {}

  manual_timer_t make_timer() { return manual_timer_t{clock_}; }

  std::shared_ptr<strata::testing::virtual_clock> clock_;
};

}  // namespace

TEST_F(cron_test, fires_once_per_occurrence) {
  auto fired = std::vector<strata::schema::timestamp_milliseconds_t>{};
  auto job = strata::schedule::crontab(
      make_timer(), "0 8 1 * *", [&] { fired.push_back(clock_->now()); });
  clock_->run_pending();
  EXPECT_EQ(job->state(), cron_state_t::scheduled);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 2, 1, 8));

  clock_->advance_to(calendar::make_timestamp(2024, 4, 15));

  EXPECT_EQ(fired, (std::vector<strata::schema::timestamp_milliseconds_t>{
                       calendar::make_timestamp(2024, 2, 1, 8),
                       calendar::make_timestamp(2024, 3, 1, 8),
                       calendar::make_timestamp(2024, 4, 1, 8)}));
  EXPECT_EQ(job->fire_count(), 3u);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 5, 1, 8));
}

TEST_F(cron_test, every_minute_fires_each_minute) {
  auto fired = std::vector<strata::schema::timestamp_milliseconds_t>{};
  auto job = strata::schedule::crontab(
      make_timer(), "* * * * *", [&] { fired.push_back(clock_->now()); });
  clock_->run_pending();
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 1, 15, 0, 1));

  clock_->advance_to(calendar::make_timestamp(2024, 1, 15, 0, 5));

  ASSERT_EQ(fired.size(), 5u);
  EXPECT_EQ(fired.front(), calendar::make_timestamp(2024, 1, 15, 0, 1));
  EXPECT_EQ(fired.back(), calendar::make_timestamp(2024, 1, 15, 0, 5));
  EXPECT_EQ(job->fire_count(), 5u);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 1, 15, 0, 6));
}

TEST_F(cron_test, late_wake_fires_once_for_all_missed_periods) {
  auto count = 0;
  auto job = strata::schedule::crontab(make_timer(), "0 8 1 * *",
                                       [&] { ++count; });
  clock_->run_pending();

  // Suspended across four occurrences.
  clock_->jump_to(calendar::make_timestamp(2024, 6, 15));
  clock_->run_pending();

  EXPECT_EQ(count, 1);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 7, 1, 8));
  clock_->advance_to(calendar::make_timestamp(2024, 7, 1, 8));
  EXPECT_EQ(count, 2);
}

TEST_F(cron_test, slow_callback_is_followed_by_one_catch_up_fire) {
  auto count = 0;
  auto job = strata::schedule::crontab(make_timer(), "0 8 1 * *", [&] {
    if (++count == 1) {
      clock_->jump_to(calendar::make_timestamp(2024, 4, 5));
    }
  });
  clock_->run_pending();

  clock_->advance_to(calendar::make_timestamp(2024, 2, 1, 8));
  EXPECT_EQ(count, 1);
  clock_->run_pending();
  EXPECT_EQ(count, 2);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 5, 1, 8));
}

TEST_F(cron_test, stop_suppresses_firings_and_start_resumes_from_now) {
  auto count = 0;
  auto job = strata::schedule::crontab(make_timer(), "0 8 1 * *",
                                       [&] { ++count; });
  clock_->run_pending();
  job->stop();
  clock_->run_pending();
  EXPECT_EQ(job->state(), cron_state_t::stopped);
  EXPECT_FALSE(job->next_fire_time().has_value());

  clock_->advance_to(calendar::make_timestamp(2024, 3, 15));
  EXPECT_EQ(count, 0);
  EXPECT_EQ(clock_->pending_waits(), 0u);

  job->start();
  clock_->run_pending();
  EXPECT_EQ(job->state(), cron_state_t::scheduled);
  EXPECT_EQ(job->next_fire_time(), calendar::make_timestamp(2024, 4, 1, 8));
  clock_->advance_to(calendar::make_timestamp(2024, 4, 2));
  EXPECT_EQ(count, 1);
}

TEST_F(cron_test, stop_from_inside_the_callback_lets_it_finish) {
  auto finished = false;
  auto job = std::shared_ptr<strata::schedule::cron<
      strata::testing::manual_timer_tag>>{};
  job = strata::schedule::crontab(make_timer(), "0 8 1 * *", [&] {
    job->stop();
    finished = true;
  });
  clock_->advance_to(calendar::make_timestamp(2024, 6, 1));

  EXPECT_TRUE(finished);
  EXPECT_EQ(job->fire_count(), 1u);
  EXPECT_EQ(job->state(), cron_state_t::stopped);
  EXPECT_EQ(clock_->pending_waits(), 0u);
}

TEST_F(cron_test, callback_errors_reach_the_observer_and_scheduling_continues) {
  auto errors = std::vector<std::string>{};
  auto job = strata::schedule::crontab(
      make_timer(), "0 8 1 * *", [] { throw std::runtime_error{"boom"}; },
      std::tuple{}, false);
  job->set_error_observer([&](const std::string& name, std::exception_ptr error) {
    try {
      std::rethrow_exception(error);
    } catch (const std::runtime_error& e) {
      errors.push_back(name + ": " + e.what());
    }
  });
  job->start();
  clock_->advance_to(calendar::make_timestamp(2024, 3, 2));

  EXPECT_EQ(errors, (std::vector<std::string>{"0 8 1 * *: boom",
                                              "0 8 1 * *: boom"}));
  EXPECT_EQ(job->fire_count(), 2u);
  EXPECT_EQ(job->state(), cron_state_t::scheduled);
}

TEST_F(cron_test, arguments_are_forwarded_to_the_job) {
  auto seen = std::vector<std::string>{};
  auto job = strata::schedule::crontab(
      make_timer(), "@daily",
      [&](const std::string& label, const int value) {
        seen.push_back(label + std::to_string(value));
      },
      std::tuple{std::string{"run-"}, 7});
  clock_->advance_to(calendar::make_timestamp(2024, 1, 16, 12));
  EXPECT_EQ(seen, (std::vector<std::string>{"run-7"}));
}

TEST_F(cron_test, without_autostart_nothing_is_armed) {
  auto job = strata::schedule::crontab(make_timer(), "0 8 1 * *", [] {},
                                       std::tuple{}, false, "UTC+8");
  clock_->advance_to(calendar::make_timestamp(2024, 3, 1));
  EXPECT_EQ(job->state(), cron_state_t::idle);
  EXPECT_EQ(job->fire_count(), 0u);
  EXPECT_NE(job->to_string().find("UTC+08:00"), std::string::npos);
  EXPECT_NE(job->to_string().find("idle"), std::string::npos);
}

TEST_F(cron_test, bad_expression_or_zone_is_rejected_up_front) {
  EXPECT_THROW(strata::schedule::crontab(make_timer(), "0 8 32 * *", [] {}),
               strata::common::configuration_error);
  EXPECT_THROW(strata::schedule::crontab(make_timer(), "0 8 1 * *", [] {},
                                         std::tuple{}, true, "Nowhere/Town"),
               strata::common::configuration_error);
  EXPECT_EQ(clock_->pending_waits(), 0u);
}
