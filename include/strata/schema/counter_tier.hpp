#pragma once

#include <strata/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: counter tier.
// Counting workflow: Granularity holding a month's counts. A month starts in
// the fine (daily) tier and only ever moves forward to medium, then total.
namespace strata::schema {

enum class counter_tier_t : uint8_t {
  fine = 0,
  medium = 1,
  total = 2,
};

template <>
struct enum_names<counter_tier_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, counter_tier_t>, 3>{{
          {"fine", counter_tier_t::fine},
          {"medium", counter_tier_t::medium},
          {"total", counter_tier_t::total},
      }};
};

}  // namespace strata::schema
