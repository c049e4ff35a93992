#pragma once

#include <strata/schema/counter_rows.hpp>
#include <strata/schema/counter_type.hpp>
#include <strata/schema/history_log.hpp>
#include <strata/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: counter keys.
// Counting workflow: Canonical key layout for the counter tiers, tier markers
// and bounded history logs. Every key starts with "<schema>|" so a whole
// schema can be dropped by prefix.
namespace strata::schema::key {

inline constexpr std::string_view kFineKeyPrefix{"CNT|FINE|"};
inline constexpr std::string_view kMediumKeyPrefix{"CNT|MONTH|"};
inline constexpr std::string_view kTotalKeyPrefix{"CNT|TOTAL|"};
inline constexpr std::string_view kTierKeyPrefix{"CNT|TIER|"};
inline constexpr std::string_view kHistoryKeyPrefix{"HIST|LOG|"};
inline constexpr std::string_view kHistorySequencePrefix{"HIST|SEQ|"};

/// "<schema>|"
bytes_t make_schema_prefix(std::string_view schema);

/// "<schema>|<keyspace>"
bytes_t make_keyspace_prefix(std::string_view schema,
                             std::string_view keyspace);

/// "<schema>|<keyspace>" + subject [+ scope]
bytes_t make_owner_prefix(std::string_view schema,
                          std::string_view keyspace,
                          subject_id_t subject);
bytes_t make_owner_prefix(std::string_view schema,
                          std::string_view keyspace,
                          subject_id_t subject,
                          scope_id_t scope);

bytes_t make_fine_key(std::string_view schema,
                      subject_id_t subject,
                      scope_id_t scope,
                      counter_type_t type,
                      timestamp_milliseconds_t day_bucket);

bytes_t make_medium_key(std::string_view schema,
                        subject_id_t subject,
                        scope_id_t scope,
                        counter_type_t type,
                        timestamp_milliseconds_t month_bucket);

bytes_t make_total_key(std::string_view schema,
                       subject_id_t subject,
                       scope_id_t scope,
                       counter_type_t type);

bytes_t make_tier_key(std::string_view schema,
                      timestamp_milliseconds_t month_bucket);

bytes_t make_history_key(std::string_view schema,
                         subject_id_t subject,
                         history_log_t log,
                         timestamp_milliseconds_t timestamp,
                         uint64_t sequence);

bytes_t make_history_log_prefix(std::string_view schema,
                                subject_id_t subject,
                                history_log_t log);

bytes_t make_history_sequence_key(std::string_view schema,
                                  subject_id_t subject,
                                  history_log_t log);

/// Parse the identifying fields of a counter key. The count field of the
/// returned row is left at zero. std::nullopt when the key does not belong to
/// the keyspace or has the wrong length.
std::optional<fine_counter_t> parse_fine_key(std::string_view schema,
                                             const bytes_view_t& key);
std::optional<medium_counter_t> parse_medium_key(std::string_view schema,
                                                 const bytes_view_t& key);
std::optional<total_counter_t> parse_total_key(std::string_view schema,
                                               const bytes_view_t& key);

/// Subject and log named by a history sequence key.
std::optional<std::pair<subject_id_t, history_log_t>>
parse_history_sequence_key(std::string_view schema, const bytes_view_t& key);

}  // namespace strata::schema::key
