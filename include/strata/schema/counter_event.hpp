#pragma once

#include <strata/schema/counter_type.hpp>
#include <strata/schema/primitives.hpp>

// Schema type: counter event.
// Counting workflow: One ingested scope event waiting to be added to the fine
// tier.
namespace strata::schema {

struct counter_event_t final {
  subject_id_t subject_id{};
  scope_id_t scope_id{};
  counter_type_t type{counter_type_t::count};
  timestamp_milliseconds_t timestamp{};
  count_t delta{1};
};

}  // namespace strata::schema
