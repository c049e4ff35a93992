#pragma once

#include <strata/retention/retention_policy.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/history_entry.hpp>
#include <strata/schema/history_log.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace strata::retention {

/// Keeps each per-subject history log at or below its cap.
///
/// Every insert locks the log's sequence key exclusively, appends the entry
/// and deletes whatever falls past the cap, all in one transaction. A log is
/// therefore never observed over its cap.
class retention_enforcer final {
 public:
  explicit retention_enforcer(
      strata::schema::encoding::encoder<
          strata::schema::encoding::scale_encoder_tag>& encoder,
      strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
      std::string schema,
      retention_policy policy = {});

  /// Append `entry` to the subject's `entry.log`. Returns false when the insert
  /// was skipped as a duplicate of the most recent entry.
  bool on_insert(strata::schema::subject_id_t subject,
                 strata::schema::history_entry_t entry);

  /// Trim every log of the schema down to the current caps, one log per
  /// transaction under the same lock as on_insert. Needed after a cap is
  /// lowered. Returns the number of entries removed.
  std::size_t enforce_caps();

  /// Retained entries, most recent first.
  std::vector<strata::schema::history_entry_t> entries(
      strata::schema::subject_id_t subject,
      strata::schema::history_log_t log) const;

  const retention_policy& policy() const { return policy_; }

 private:
  strata::schema::encoding::encoder<
      strata::schema::encoding::scale_encoder_tag>& encoder_;
  strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage_;
  std::string schema_;
  retention_policy policy_;
};

}  // namespace strata::retention
