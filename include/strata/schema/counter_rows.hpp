#pragma once

#include <strata/schema/counter_type.hpp>
#include <strata/schema/primitives.hpp>

// Schema type: counter rows.
// Counting workflow: Decoded views of the three counter tiers, as listed by
// the counter store.
namespace strata::schema {

template <uint16_t Version>
struct fine_counter;

template <>
struct fine_counter<1> final {
  uint16_t version{1};
  subject_id_t subject_id{};
  scope_id_t scope_id{};
  counter_type_t type{counter_type_t::count};
  timestamp_milliseconds_t day_bucket{};
  count_t count{};
};

template <uint16_t Version>
struct medium_counter;

template <>
struct medium_counter<1> final {
  uint16_t version{1};
  subject_id_t subject_id{};
  scope_id_t scope_id{};
  counter_type_t type{counter_type_t::count};
  timestamp_milliseconds_t month_bucket{};
  count_t count{};
};

template <uint16_t Version>
struct total_counter;

template <>
struct total_counter<1> final {
  uint16_t version{1};
  subject_id_t subject_id{};
  scope_id_t scope_id{};
  counter_type_t type{counter_type_t::count};
  count_t count{};
};

using fine_counter_t = fine_counter<1>;
using medium_counter_t = medium_counter<1>;
using total_counter_t = total_counter<1>;

}  // namespace strata::schema
