#pragma once

#include <strata/schema/history_log.hpp>
#include <strata/schema/tie_break_policy.hpp>
#include <array>
#include <cstddef>

namespace strata::retention {

struct log_policy_t final {
  /// Maximum number of entries kept per (subject, log).
  std::size_t cap{1};
  /// Skip an insert whose value equals the most recent stored value.
  bool dedup_identical{false};
};

struct retention_policy final {
  std::array<log_policy_t, 3> logs{{
      {.cap = 2, .dedup_identical = false},   // presence
      {.cap = 13, .dedup_identical = true},   // avatar
      {.cap = 24, .dedup_identical = false},  // name
  }};
  strata::schema::tie_break_policy_t tie_break{
      strata::schema::tie_break_policy_t::newest_insert_wins};

  const log_policy_t& for_log(strata::schema::history_log_t log) const {
    return logs.at(static_cast<std::size_t>(log));
  }

  log_policy_t& for_log(strata::schema::history_log_t log) {
    return logs.at(static_cast<std::size_t>(log));
  }
};

/// Throws strata::common::configuration_error when a cap is zero.
void validate(const retention_policy& policy);

}  // namespace strata::retention
