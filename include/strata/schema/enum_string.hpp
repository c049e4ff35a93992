#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace strata::schema {

/// Wire names of an enum. Each enum specialises this with
/// `static constexpr std::array<std::pair<std::string_view, Enum>, N> kNames`;
/// the names are what options, logs and ingestion use.
template <typename Enum>
struct enum_names;

/// Enum value named `value`, or std::nullopt for an unknown name.
template <typename Enum,
          typename = std::enable_if_t<std::is_enum_v<Enum>>>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, entry] : enum_names<Enum>::kNames) {
    if (name == value) {
      return entry;
    }
  }
  return std::nullopt;
}

/// Wire name of `value`; "unknown" for a value outside the table.
template <typename Enum,
          typename = std::enable_if_t<std::is_enum_v<Enum>>>
constexpr std::string_view to_string(const Enum value) {
  for (const auto& [name, entry] : enum_names<Enum>::kNames) {
    if (entry == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace strata::schema
