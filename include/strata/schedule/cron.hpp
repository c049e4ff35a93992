#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <strata/schedule/schedule_spec.hpp>
#include <strata/schedule/timer.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/schema/enum_string.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace strata::schedule {

enum class cron_state_t : uint8_t {
  idle = 0,
  scheduled = 1,
  firing = 2,
  stopped = 3,
};

}  // namespace strata::schedule

namespace strata::schema {

template <>
struct enum_names<strata::schedule::cron_state_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, strata::schedule::cron_state_t>,
                 4>{{
          {"idle", strata::schedule::cron_state_t::idle},
          {"scheduled", strata::schedule::cron_state_t::scheduled},
          {"firing", strata::schedule::cron_state_t::firing},
          {"stopped", strata::schedule::cron_state_t::stopped},
      }};
};

}  // namespace strata::schema

namespace strata::schedule {

/// Receives every exception thrown by a cron callback.
using cron_error_observer_t =
    std::function<void(const std::string& cron, std::exception_ptr error)>;

/// A recurring job on one timer.
///
/// Idle -> Scheduled -> Firing -> Scheduled ..., and Stopped from any state
/// until the next start(). Only one callback is ever in flight: the next
/// occurrence is armed after the callback returns. When the loop falls
/// behind, missed occurrences collapse into one immediate catch-up fire.
template <typename Library>
class cron final : public std::enable_shared_from_this<cron<Library>> {
 public:
  cron(timer<Library> wait_timer,
       schedule_spec spec,
       std::function<void()> callback,
       std::string name = {})
      : timer_{std::move(wait_timer)},
        spec_{std::move(spec)},
        callback_{std::move(callback)},
        name_{name.empty() ? spec_.expression.source() : std::move(name)} {}

  /// Begin firing from the current time. Safe from any thread; a no-op while
  /// already running.
  void start() {
    timer_.post([self = this->shared_from_this()] {
      auto state = self->state_.load();
      if (state == cron_state_t::scheduled || state == cron_state_t::firing) {
        return;
      }
      self->stop_requested_ = false;
      self->initialize();
      self->call_next();
      spdlog::info("Started {}", self->to_string());
    });
  }

  /// Suppress future firings. Safe from any thread and never waits for an
  /// in-flight callback, which runs to completion.
  void stop() {
    stop_requested_ = true;
    timer_.post([self = this->shared_from_this()] {
      self->stop_requested_ = true;
      self->state_ = cron_state_t::stopped;
      ++self->generation_;
      self->timer_.cancel();
      spdlog::info("Stopped {}", self->to_string());
    });
  }

  /// Forget previous fires and compute the first occurrence after now.
  void initialize() {
    last_wake_.reset();
    next_ = get_next().value_or(0);
    state_ = cron_state_t::idle;
  }

  /// Next occurrence strictly after the last wake, or after now before the
  /// first fire. If that occurrence has already passed, returns now.
  std::optional<strata::schema::timestamp_milliseconds_t> get_next() {
    auto now = timer_.now();
    if (!last_wake_) {
      return spec_.next_after(now);
    }
    auto following = spec_.next_after(*last_wake_);
    if (following && *following <= now) {
      spdlog::warn("{} missed {}; firing once to catch up", name_,
                   strata::schema::calendar::to_iso_string(*following));
      return now;
    }
    return following;
  }

  /// Arm the timer for the computed next occurrence.
  void call_next() {
    if (stop_requested_) {
      state_ = cron_state_t::stopped;
      return;
    }
    if (next_ == 0) {
      spdlog::error("{} has no future occurrence; stopping", name_);
      state_ = cron_state_t::stopped;
      return;
    }
    state_ = cron_state_t::scheduled;
    auto generation = ++generation_;
    timer_.arm(next_, [self = this->shared_from_this(),
                       generation](const bool cancelled) {
      self->on_expiry(generation, cancelled);
    });
    spdlog::debug("{} armed for {}", name_,
                  strata::schema::calendar::to_iso_string(next_));
  }

  /// Invoke the job. Exceptions go to the error observer and the log and
  /// never reach the event loop.
  void call_func() {
    try {
      callback_();
    } catch (const std::exception& e) {
      spdlog::error("{} callback failed: {}", name_, e.what());
      report(std::current_exception());
    } catch (...) {
      spdlog::error("{} callback failed with a non-standard exception", name_);
      report(std::current_exception());
    }
    ++fire_count_;
  }

  void set_error_observer(cron_error_observer_t observer) {
    on_error_ = std::move(observer);
  }

  cron_state_t state() const { return state_.load(); }

  std::optional<strata::schema::timestamp_milliseconds_t> next_fire_time()
      const {
    auto next = next_.load();
    if (next == 0 || state_.load() == cron_state_t::stopped) {
      return std::nullopt;
    }
    return next;
  }

  std::size_t fire_count() const { return fire_count_.load(); }

  const std::string& name() const { return name_; }

  std::string to_string() const {
    auto next = next_fire_time();
    return fmt::format(
        "cron {} ({}) {} next={}", name_, spec_.to_string(),
        strata::schema::to_string(state_.load()),
        next ? strata::schema::calendar::to_iso_string(*next) : "none");
  }

 private:
  void on_expiry(const uint64_t generation, const bool cancelled) {
    if (cancelled || generation != generation_) {
      return;
    }
    if (stop_requested_) {
      state_ = cron_state_t::stopped;
      return;
    }
    state_ = cron_state_t::firing;
    last_wake_ = timer_.now();
    spdlog::debug("{} firing at {}", name_,
                  strata::schema::calendar::to_iso_string(*last_wake_));
    call_func();
    if (stop_requested_) {
      state_ = cron_state_t::stopped;
      return;
    }
    next_ = get_next().value_or(0);
    call_next();
  }

  void report(std::exception_ptr error) {
    if (on_error_) {
      on_error_(name_, std::move(error));
    }
  }

  timer<Library> timer_;
  schedule_spec spec_;
  std::function<void()> callback_;
  std::string name_;
  cron_error_observer_t on_error_;
  std::atomic<cron_state_t> state_{cron_state_t::idle};
  std::atomic<bool> stop_requested_{false};
  std::atomic<strata::schema::timestamp_milliseconds_t> next_{0};  // 0: none
  std::atomic<std::size_t> fire_count_{0};
  std::optional<strata::schema::timestamp_milliseconds_t> last_wake_;
  uint64_t generation_{0};
};

/// Register `fn(args...)` to run on every occurrence of `expression` in
/// `time_zone`. Throws strata::common::configuration_error for a bad
/// expression or timezone before anything is scheduled.
template <typename Library, typename Fn, typename... Args>
std::shared_ptr<cron<Library>> crontab(timer<Library> wait_timer,
                                       const std::string_view expression,
                                       Fn fn,
                                       std::tuple<Args...> args = {},
                                       const bool start = true,
                                       const std::string_view time_zone = "UTC") {
  auto spec = make_schedule_spec(expression, time_zone);
  auto callback = [fn = std::move(fn), args = std::move(args)]() mutable {
    std::apply(fn, args);
  };
  auto job = std::make_shared<cron<Library>>(std::move(wait_timer), std::move(spec),
                                             std::move(callback));
  if (start) {
    job->start();
  }
  return job;
}

}  // namespace strata::schedule
