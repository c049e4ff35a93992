#pragma once

#include <strata/schema/period_token.hpp>
#include <strata/schema/primitives.hpp>
#include <cstddef>

// Schema type: rollup report.
// Counting workflow: Outcome of one committed aggregation. An empty window
// (nothing left to promote) reports zero groups and zero rows.
namespace strata::schema {

struct rollup_report_t final {
  period_token_t token{period_token_t::month};
  timestamp_milliseconds_t window_start{};
  timestamp_milliseconds_t window_end{};  // Exclusive
  std::size_t groups{};
  std::size_t rows_deleted{};
  count_t mass_moved{};
};

}  // namespace strata::schema
