#pragma once
#include <strata/common/error.hpp>
#include <strata/rollup/aggregator.hpp>
#include <strata/schedule/cron.hpp>
#include <strata/schema/period_token.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace strata::schedule {

/// The monthly and yearly rollup crons of one aggregator.
template <typename Library>
struct rollup_jobs final {
  std::shared_ptr<cron<Library>> month;
  std::shared_ptr<cron<Library>> year;

  void start() {
    month->start();
    year->start();
  }

  void stop() {
    month->stop();
    year->stop();
  }
};

/// Job body for one rollup cron. A window whose rollup failed with a
/// transient store error is retried at the next occurrence, before that
/// occurrence's own window; the failure still reaches the cron's observer.
inline auto make_rollup_job(strata::rollup::aggregator& aggregator) {
  return [&aggregator,
          missed = std::make_shared<
              std::vector<strata::schema::timestamp_milliseconds_t>>()](
             const strata::schema::period_token_t token) {
    auto instants = std::exchange(*missed, {});
    instants.push_back(aggregator.now());

    auto failure = std::exception_ptr{};
    for (const auto instant : instants) {
      try {
        aggregator.aggregate(token, instant);
      } catch (const strata::common::transient_store_error&) {
        missed->push_back(instant);
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
  };
}

/// Register the aggregator's two rollups. `make_timer` supplies one timer
/// per cron. A failed rollup is reported through `observer` and its window
/// is picked up again at the next occurrence, never retried immediately.
template <typename Library>
rollup_jobs<Library> schedule_rollups(
    strata::rollup::aggregator& aggregator,
    const std::function<timer<Library>()>& make_timer,
    const std::string_view month_expression,
    const std::string_view year_expression,
    const std::string_view time_zone,
    const bool start = true,
    cron_error_observer_t observer = {}) {
  auto jobs = rollup_jobs<Library>{
      .month = crontab(make_timer(), month_expression,
                       make_rollup_job(aggregator),
                       std::tuple{strata::schema::period_token_t::month}, false,
                       time_zone),
      .year = crontab(make_timer(), year_expression,
                      make_rollup_job(aggregator),
                      std::tuple{strata::schema::period_token_t::year}, false,
                      time_zone)};
  jobs.month->set_error_observer(observer);
  jobs.year->set_error_observer(observer);
  if (start) {
    jobs.start();
  }
  return jobs;
}

}  // namespace strata::schedule
