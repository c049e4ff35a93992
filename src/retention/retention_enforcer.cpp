#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/retention/retention_enforcer.hpp>
#include <strata/schema/key/counter_keys.hpp>

#include <algorithm>
#include <tuple>

namespace strata::retention {

namespace {

using encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;
using transaction_t =
    strata::storage::transaction<strata::storage::rocksdb_storage_tag>;
using read_view_t =
    strata::storage::read_view<strata::storage::rocksdb_storage_tag>;

// Stored value of a history row: version, value, detail, timestamp, sequence.
using history_value_t = std::tuple<uint16_t,
                                   strata::schema::bytes_t,
                                   std::string,
                                   strata::schema::timestamp_milliseconds_t,
                                   uint64_t>;

struct stored_entry_t final {
  strata::schema::bytes_t key;
  strata::schema::history_entry_t entry;
};

history_value_t to_value(const strata::schema::history_entry_t& entry) {
  return {entry.version, entry.value, entry.detail, entry.timestamp,
          entry.sequence};
}

strata::schema::history_entry_t from_value(
    const strata::schema::subject_id_t subject,
    const strata::schema::history_log_t log,
    const history_value_t& value) {
  const auto& [version, payload, detail, timestamp, sequence] = value;
  return strata::schema::history_entry_t{.version = version,
                                         .subject_id = subject,
                                         .log = log,
                                         .value = payload,
                                         .detail = detail,
                                         .timestamp = timestamp,
                                         .sequence = sequence};
}

/// Most recent first under the configured tie-break.
void rank(std::vector<stored_entry_t>& entries,
          const strata::schema::tie_break_policy_t tie_break) {
  std::sort(std::begin(entries), std::end(entries),
            [tie_break](const stored_entry_t& lhs, const stored_entry_t& rhs) {
              if (lhs.entry.timestamp != rhs.entry.timestamp) {
                return lhs.entry.timestamp > rhs.entry.timestamp;
              }
              if (tie_break ==
                  strata::schema::tie_break_policy_t::newest_insert_wins) {
                return lhs.entry.sequence > rhs.entry.sequence;
              }
              return lhs.entry.sequence < rhs.entry.sequence;
            });
}

template <typename View>
std::vector<stored_entry_t> load_log(encoder_t& encoder,
                                     View& view,
                                     const std::string& schema,
                                     const strata::schema::subject_id_t subject,
                                     const strata::schema::history_log_t log) {
  auto entries = std::vector<stored_entry_t>{};
  auto prefix =
      strata::schema::key::make_history_log_prefix(schema, subject, log);
  for (auto& [key, value] : view.list_by_prefix(prefix)) {
    auto decoded = encoder.decode<history_value_t>(
        strata::schema::bytes_view_t{value});
    entries.push_back(stored_entry_t{.key = std::move(key),
                                     .entry = from_value(subject, log, decoded)});
  }
  return entries;
}

/// Deletes every entry ranked past `cap`. Returns the number removed.
std::size_t trim(transaction_t& transaction,
                 std::vector<stored_entry_t>& stored,
                 const std::size_t cap,
                 const strata::schema::tie_break_policy_t tie_break) {
  rank(stored, tie_break);
  auto removed = std::size_t{};
  for (auto i = cap; i < stored.size(); ++i) {
    transaction.remove(stored[i].key);
    ++removed;
  }
  return removed;
}

}  // namespace

void validate(const retention_policy& policy) {
  for (const auto& [name, log] : strata::schema::enum_names<strata::schema::history_log_t>::kNames) {
    if (policy.for_log(log).cap == 0) {
      throw strata::common::configuration_error{
          fmt::format("history cap for '{}' must be at least 1", name)};
    }
  }
}

retention_enforcer::retention_enforcer(
    encoder_t& encoder,
    strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
    std::string schema,
    retention_policy policy)
    : encoder_{encoder},
      storage_{storage},
      schema_{std::move(schema)},
      policy_{std::move(policy)} {
  validate(policy_);
}

bool retention_enforcer::on_insert(const strata::schema::subject_id_t subject,
                                   strata::schema::history_entry_t entry) {
  const auto& log_policy = policy_.for_log(entry.log);
  entry.subject_id = subject;

  auto trimmed = storage_.transact([&](transaction_t& transaction)
                                       -> std::optional<std::size_t> {
    auto sequence_key = strata::schema::key::make_history_sequence_key(
        schema_, subject, entry.log);
    auto last_sequence =
        transaction.get_for_update<uint64_t>(encoder_, sequence_key);

    auto stored = load_log(encoder_, transaction, schema_, subject, entry.log);
    rank(stored, policy_.tie_break);

    if (log_policy.dedup_identical && !stored.empty() &&
        stored.front().entry.value == entry.value) {
      return std::nullopt;
    }

    entry.sequence = last_sequence.value_or(0) + 1;
    auto entry_key = strata::schema::key::make_history_key(
        schema_, subject, entry.log, entry.timestamp, entry.sequence);
    if (transaction.get_for_update(entry_key)) {
      throw strata::common::integrity_violation{
          fmt::format("history entry {} already exists",
                      strata::schema::to_hex(entry_key))};
    }
    transaction.put(encoder_, sequence_key, entry.sequence);
    transaction.put(encoder_, entry_key, to_value(entry));

    stored.push_back(stored_entry_t{.key = entry_key, .entry = entry});
    return trim(transaction, stored, log_policy.cap, policy_.tie_break);
  });

  if (!trimmed) {
    spdlog::debug("Skipped duplicate {} entry for subject {}",
                  strata::schema::to_string(entry.log), subject);
    return false;
  }
  if (*trimmed > 0) {
    spdlog::debug("Trimmed {} {} entries for subject {}", *trimmed,
                  strata::schema::to_string(entry.log), subject);
  }
  return true;
}

std::size_t retention_enforcer::enforce_caps() {
  auto logs = storage_.list_by_prefix(strata::schema::key::make_keyspace_prefix(
      schema_, strata::schema::key::kHistorySequencePrefix));

  auto removed = std::size_t{};
  for (const auto& entry : logs) {
    const auto& sequence_key = entry.first;
    auto owner = strata::schema::key::parse_history_sequence_key(
        schema_, strata::schema::bytes_view_t{sequence_key});
    if (!owner) {
      throw strata::common::integrity_violation{
          fmt::format("malformed history sequence key {}",
                      strata::schema::to_hex(sequence_key))};
    }
    auto subject = owner->first;
    auto log = owner->second;
    removed += storage_.transact([&](transaction_t& transaction) {
      if (!transaction.get_for_update(sequence_key)) {
        return std::size_t{};
      }
      auto stored = load_log(encoder_, transaction, schema_, subject, log);
      return trim(transaction, stored, policy_.for_log(log).cap,
                  policy_.tie_break);
    });
  }
  if (removed > 0) {
    spdlog::info("Trimmed {} history entries over their caps", removed);
  }
  return removed;
}

std::vector<strata::schema::history_entry_t> retention_enforcer::entries(
    const strata::schema::subject_id_t subject,
    const strata::schema::history_log_t log) const {
  return storage_.read([&](const read_view_t& view) {
    auto stored = load_log(encoder_, view, schema_, subject, log);
    rank(stored, policy_.tie_break);
    auto result = std::vector<strata::schema::history_entry_t>{};
    result.reserve(stored.size());
    for (auto& item : stored) {
      result.push_back(std::move(item.entry));
    }
    return result;
  });
}

}  // namespace strata::retention
