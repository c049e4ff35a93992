#pragma once

#include <strata/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: counter type.
// Counting workflow: Which kind of scope event a counter row tallies. The
// string forms are the names ingestion uses.
namespace strata::schema {

enum class counter_type_t : uint8_t {
  count = 0,
  hunt = 1,
  battle = 2,
};

template <>
struct enum_names<counter_type_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, counter_type_t>, 3>{{
          {"count", counter_type_t::count},
          {"hunt", counter_type_t::hunt},
          {"battle", counter_type_t::battle},
      }};
};

}  // namespace strata::schema
