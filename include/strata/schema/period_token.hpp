#pragma once

#include <strata/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: period token.
// Counting workflow: Selects which tier-to-tier rollup an aggregation runs.
namespace strata::schema {

enum class period_token_t : uint8_t {
  month = 0,  // fine -> medium
  year = 1,   // medium -> total
};

template <>
struct enum_names<period_token_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, period_token_t>, 2>{{
          {"month", period_token_t::month},
          {"year", period_token_t::year},
      }};
};

}  // namespace strata::schema
