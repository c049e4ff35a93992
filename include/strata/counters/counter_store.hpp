#pragma once

#include <strata/schema/counter_event.hpp>
#include <strata/schema/counter_rows.hpp>
#include <strata/schema/counter_tier.hpp>
#include <strata/schema/counter_type.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace strata::counters {

/// Foreign-key check against the external identity store. Return false to
/// reject a (subject, scope) pair.
using identity_guard_t =
    std::function<bool(strata::schema::subject_id_t subject,
                       strata::schema::scope_id_t scope)>;

/// Every counter row and tier marker for one (subject, scope), read from a
/// single snapshot.
struct counter_snapshot_t final {
  std::vector<strata::schema::fine_counter_t> fine;
  std::vector<strata::schema::medium_counter_t> medium;
  std::vector<strata::schema::total_counter_t> total;
  /// Months that left the fine tier, by month bucket. Absent means fine.
  std::map<strata::schema::timestamp_milliseconds_t,
           strata::schema::counter_tier_t>
      tiers;

  strata::schema::counter_tier_t tier_of(
      strata::schema::timestamp_milliseconds_t month_bucket) const;
};

/// Persists the fine, medium and total counter tiers.
///
/// Increments are read-modify-write transactions holding an exclusive lock on
/// the counter row and a shared lock on the tier marker of the event's month.
/// When that month has already been rolled up the delta lands in the tier now
/// holding it.
class counter_store final {
 public:
  explicit counter_store(
      strata::schema::encoding::encoder<
          strata::schema::encoding::scale_encoder_tag>& encoder,
      strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
      std::string schema);

  /// Add `delta` to the fine row of (subject, scope, type, day(timestamp)).
  void increment(strata::schema::subject_id_t subject,
                 strata::schema::scope_id_t scope,
                 strata::schema::counter_type_t type,
                 strata::schema::timestamp_milliseconds_t timestamp,
                 strata::schema::count_t delta = 1);

  /// Apply a batch of increments in one transaction. All-or-nothing.
  void increment_batch(const std::vector<strata::schema::counter_event_t>& events);

  /// Cascade removal of every row owned by a subject, history included.
  void purge_subject(strata::schema::subject_id_t subject);

  /// Cascade removal of every counter row owned by a scope.
  void purge_scope(strata::schema::scope_id_t scope);

  counter_snapshot_t snapshot(strata::schema::subject_id_t subject,
                              strata::schema::scope_id_t scope) const;

  std::vector<strata::schema::fine_counter_t> fine_rows(
      strata::schema::subject_id_t subject,
      strata::schema::scope_id_t scope) const;
  std::vector<strata::schema::medium_counter_t> medium_rows(
      strata::schema::subject_id_t subject,
      strata::schema::scope_id_t scope) const;
  std::vector<strata::schema::total_counter_t> total_rows(
      strata::schema::subject_id_t subject,
      strata::schema::scope_id_t scope) const;

  strata::schema::counter_tier_t tier_of(
      strata::schema::timestamp_milliseconds_t month_bucket) const;

  void set_identity_guard(identity_guard_t guard);

  const std::string& schema() const { return schema_; }

 private:
  void check_identity(strata::schema::subject_id_t subject,
                      strata::schema::scope_id_t scope) const;

  strata::schema::encoding::encoder<
      strata::schema::encoding::scale_encoder_tag>& encoder_;
  strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage_;
  std::string schema_;
  identity_guard_t identity_guard_;
};

/// Decode a tier marker value; an unknown tier byte is storage corruption.
strata::schema::counter_tier_t decode_tier(
    strata::schema::encoding::encoder<
        strata::schema::encoding::scale_encoder_tag>& encoder,
    const strata::schema::bytes_view_t& value);

}  // namespace strata::counters
