#pragma once
#include <strata/schema/primitives.hpp>
#include <functional>

namespace strata::schedule {

/// Completion handler of an armed timer. `cancelled` is true when the wait
/// was cancelled rather than expired.
using timer_handler_t = std::function<void(bool cancelled)>;

/// One-shot wall-clock timer driving a single cron. Every member except
/// post() must be called from the timer's own event loop.
template <typename Library>
struct timer {
  /// Current wall-clock time as seen by this timer.
  strata::schema::timestamp_milliseconds_t now() const;

  /// Arm the timer for `deadline`, replacing any pending wait. A deadline in
  /// the past expires immediately.
  void arm(strata::schema::timestamp_milliseconds_t deadline,
           timer_handler_t handler);

  /// Cancel the pending wait, if any.
  void cancel();

  /// Run fn on the timer's event loop. Safe from any thread.
  void post(std::function<void()> fn);
};

}  // namespace strata::schedule
