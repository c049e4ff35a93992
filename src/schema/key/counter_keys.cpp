#include <strata/schema/key/builder.hpp>
#include <strata/schema/key/counter_keys.hpp>

#include <algorithm>

namespace strata::schema::key {

namespace {

inline constexpr auto kOwnerWidth = sizeof(subject_id_t) + sizeof(scope_id_t);
inline constexpr auto kTypeWidth = sizeof(uint8_t);
inline constexpr auto kBucketWidth = sizeof(timestamp_milliseconds_t);

builder make_keyspace_builder(const std::string_view schema,
                              const std::string_view keyspace) {
  auto out = builder{};
  out.write(schema).write(std::string_view{"|"}).write(keyspace);
  return out;
}

builder make_owner_builder(const std::string_view schema,
                           const std::string_view keyspace,
                           const subject_id_t subject,
                           const scope_id_t scope,
                           const counter_type_t type) {
  auto out = make_keyspace_builder(schema, keyspace);
  out.write(subject).write(scope).write(static_cast<uint8_t>(type));
  return out;
}

/// Offset of the first field after "<schema>|<keyspace>", or std::nullopt
/// when `key` is not in that keyspace or is not `width` bytes past it.
std::optional<std::size_t> field_offset(const std::string_view schema,
                                        const std::string_view keyspace,
                                        const bytes_view_t& key,
                                        const std::size_t width) {
  auto prefix = make_keyspace_prefix(schema, keyspace);
  if (key.size() != prefix.size() + width ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return prefix.size();
}

std::optional<counter_type_t> read_type(const bytes_view_t& key,
                                        const std::size_t offset) {
  auto raw = read_integral<uint8_t>(key, offset);
  if (raw > static_cast<uint8_t>(counter_type_t::battle)) {
    return std::nullopt;
  }
  return static_cast<counter_type_t>(raw);
}

}  // namespace

bytes_t make_schema_prefix(const std::string_view schema) {
  return make_keyspace_prefix(schema, std::string_view{});
}

bytes_t make_keyspace_prefix(const std::string_view schema,
                             const std::string_view keyspace) {
  return make_keyspace_builder(schema, keyspace).data;
}

bytes_t make_owner_prefix(const std::string_view schema,
                          const std::string_view keyspace,
                          const subject_id_t subject) {
  auto out = make_keyspace_builder(schema, keyspace);
  out.write(subject);
  return out.data;
}

bytes_t make_owner_prefix(const std::string_view schema,
                          const std::string_view keyspace,
                          const subject_id_t subject,
                          const scope_id_t scope) {
  auto out = make_keyspace_builder(schema, keyspace);
  out.write(subject).write(scope);
  return out.data;
}

bytes_t make_fine_key(const std::string_view schema,
                      const subject_id_t subject,
                      const scope_id_t scope,
                      const counter_type_t type,
                      const timestamp_milliseconds_t day_bucket) {
  auto out = make_owner_builder(schema, kFineKeyPrefix, subject, scope, type);
  out.write(day_bucket);
  return out.data;
}

bytes_t make_medium_key(const std::string_view schema,
                        const subject_id_t subject,
                        const scope_id_t scope,
                        const counter_type_t type,
                        const timestamp_milliseconds_t month_bucket) {
  auto out =
      make_owner_builder(schema, kMediumKeyPrefix, subject, scope, type);
  out.write(month_bucket);
  return out.data;
}

bytes_t make_total_key(const std::string_view schema,
                       const subject_id_t subject,
                       const scope_id_t scope,
                       const counter_type_t type) {
  return make_owner_builder(schema, kTotalKeyPrefix, subject, scope, type)
      .data;
}

bytes_t make_tier_key(const std::string_view schema,
                      const timestamp_milliseconds_t month_bucket) {
  auto out = make_keyspace_builder(schema, kTierKeyPrefix);
  out.write(month_bucket);
  return out.data;
}

bytes_t make_history_key(const std::string_view schema,
                         const subject_id_t subject,
                         const history_log_t log,
                         const timestamp_milliseconds_t timestamp,
                         const uint64_t sequence) {
  auto out = make_keyspace_builder(schema, kHistoryKeyPrefix);
  out.write(subject).write(static_cast<uint8_t>(log)).write(timestamp).write(
      sequence);
  return out.data;
}

bytes_t make_history_log_prefix(const std::string_view schema,
                                const subject_id_t subject,
                                const history_log_t log) {
  auto out = make_keyspace_builder(schema, kHistoryKeyPrefix);
  out.write(subject).write(static_cast<uint8_t>(log));
  return out.data;
}

bytes_t make_history_sequence_key(const std::string_view schema,
                                  const subject_id_t subject,
                                  const history_log_t log) {
  auto out = make_keyspace_builder(schema, kHistorySequencePrefix);
  out.write(subject).write(static_cast<uint8_t>(log));
  return out.data;
}

std::optional<fine_counter_t> parse_fine_key(const std::string_view schema,
                                             const bytes_view_t& key) {
  auto offset = field_offset(schema, kFineKeyPrefix, key,
                             kOwnerWidth + kTypeWidth + kBucketWidth);
  if (!offset) {
    return std::nullopt;
  }
  auto type = read_type(key, *offset + kOwnerWidth);
  if (!type) {
    return std::nullopt;
  }
  return fine_counter_t{
      .subject_id = read_integral<subject_id_t>(key, *offset),
      .scope_id =
          read_integral<scope_id_t>(key, *offset + sizeof(subject_id_t)),
      .type = *type,
      .day_bucket = read_integral<timestamp_milliseconds_t>(
          key, *offset + kOwnerWidth + kTypeWidth)};
}

std::optional<medium_counter_t> parse_medium_key(const std::string_view schema,
                                                 const bytes_view_t& key) {
  auto offset = field_offset(schema, kMediumKeyPrefix, key,
                             kOwnerWidth + kTypeWidth + kBucketWidth);
  if (!offset) {
    return std::nullopt;
  }
  auto type = read_type(key, *offset + kOwnerWidth);
  if (!type) {
    return std::nullopt;
  }
  return medium_counter_t{
      .subject_id = read_integral<subject_id_t>(key, *offset),
      .scope_id =
          read_integral<scope_id_t>(key, *offset + sizeof(subject_id_t)),
      .type = *type,
      .month_bucket = read_integral<timestamp_milliseconds_t>(
          key, *offset + kOwnerWidth + kTypeWidth)};
}

std::optional<total_counter_t> parse_total_key(const std::string_view schema,
                                               const bytes_view_t& key) {
  auto offset =
      field_offset(schema, kTotalKeyPrefix, key, kOwnerWidth + kTypeWidth);
  if (!offset) {
    return std::nullopt;
  }
  auto type = read_type(key, *offset + kOwnerWidth);
  if (!type) {
    return std::nullopt;
  }
  return total_counter_t{
      .subject_id = read_integral<subject_id_t>(key, *offset),
      .scope_id =
          read_integral<scope_id_t>(key, *offset + sizeof(subject_id_t)),
      .type = *type};
}

std::optional<std::pair<subject_id_t, history_log_t>>
parse_history_sequence_key(const std::string_view schema,
                           const bytes_view_t& key) {
  auto offset = field_offset(schema, kHistorySequencePrefix, key,
                             sizeof(subject_id_t) + sizeof(uint8_t));
  if (!offset) {
    return std::nullopt;
  }
  auto raw = read_integral<uint8_t>(key, *offset + sizeof(subject_id_t));
  if (raw > static_cast<uint8_t>(history_log_t::name)) {
    return std::nullopt;
  }
  return std::pair{read_integral<subject_id_t>(key, *offset),
                   static_cast<history_log_t>(raw)};
}

}  // namespace strata::schema::key
