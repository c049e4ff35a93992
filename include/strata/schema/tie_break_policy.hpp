#pragma once

#include <strata/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: tie-break policy.
// Counting workflow: Decides which of two history entries with the same
// timestamp counts as more recent when a bounded log is trimmed.
namespace strata::schema {

enum class tie_break_policy_t : uint8_t {
  newest_insert_wins = 0,
  oldest_insert_wins = 1,
};

template <>
struct enum_names<tie_break_policy_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, tie_break_policy_t>, 2>{{
          {"newest", tie_break_policy_t::newest_insert_wins},
          {"oldest", tie_break_policy_t::oldest_insert_wins},
      }};
};

}  // namespace strata::schema
