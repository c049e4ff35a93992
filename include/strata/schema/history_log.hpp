#pragma once

#include <strata/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: history log.
// Counting workflow: Per-subject bounded logs. Each log has its own cap and
// dedup rule in retention_policy.
namespace strata::schema {

enum class history_log_t : uint8_t {
  presence = 0,
  avatar = 1,
  name = 2,
};

template <>
struct enum_names<history_log_t> final {
  static constexpr auto kNames =
      std::array<std::pair<std::string_view, history_log_t>, 3>{{
          {"presence", history_log_t::presence},
          {"avatar", history_log_t::avatar},
          {"name", history_log_t::name},
      }};
};

}  // namespace strata::schema
