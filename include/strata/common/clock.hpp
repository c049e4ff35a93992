#pragma once

#include <strata/schema/calendar.hpp>
#include <strata/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace strata::common {

/// Wall-clock source in milliseconds since the Unix epoch. Injected so
/// rollups and score queries can be evaluated at a chosen instant.
using clock_fn_t = std::function<strata::schema::timestamp_milliseconds_t()>;

inline clock_fn_t system_clock() {
  return [] {
    return strata::schema::calendar::from_time_point(
        std::chrono::system_clock::now());
  };
}

}  // namespace strata::common
