#pragma once

#include <strata/schema/primitives.hpp>

// Schema type: score.
// Counting workflow: Named time-bucket counts for one (subject, scope).
namespace strata::schema {

struct score_t final {
  count_t today{};
  count_t yesterday{};
  count_t this_week{};
  count_t last_week{};
  count_t this_month{};
  count_t last_month{};
  count_t this_year{};
  count_t last_year{};
  count_t all_time{};

  bool operator==(const score_t&) const = default;
};

}  // namespace strata::schema
