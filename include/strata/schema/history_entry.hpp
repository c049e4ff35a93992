#pragma once

#include <strata/schema/history_log.hpp>
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: history entry.
// Counting workflow: One row of a bounded per-subject log. `value` is the
// payload compared for dedup (status name, avatar bytes, display name);
// `detail` is the side field (previous status, mime format).
namespace strata::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  subject_id_t subject_id{};
  history_log_t log{history_log_t::presence};
  bytes_t value;
  std::string detail;
  timestamp_milliseconds_t timestamp{};
  uint64_t sequence{};  // Assigned on insert; insertion order within a log
};

using history_entry_t = history_entry<1>;

}  // namespace strata::schema
