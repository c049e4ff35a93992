#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/common/error.hpp>
#include <strata/counters/counter_store.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/schema/key/builder.hpp>
#include <strata/schema/key/counter_keys.hpp>

#include <map>
#include <set>

namespace strata::counters {

namespace {

using encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;
using transaction_t =
    strata::storage::transaction<strata::storage::rocksdb_storage_tag>;
using read_view_t =
    strata::storage::read_view<strata::storage::rocksdb_storage_tag>;

strata::schema::counter_tier_t lock_tier(
    encoder_t& encoder,
    transaction_t& transaction,
    const std::string& schema,
    const strata::schema::timestamp_milliseconds_t month) {
  auto tier_key = strata::schema::key::make_tier_key(schema, month);
  auto raw = transaction.get_for_update(tier_key, false);
  if (!raw) {
    return strata::schema::counter_tier_t::fine;
  }
  return decode_tier(encoder, strata::schema::bytes_view_t{*raw});
}

strata::schema::bytes_t resolve_counter_key(
    const std::string& schema,
    const strata::schema::counter_event_t& event,
    const strata::schema::counter_tier_t tier) {
  auto day = strata::schema::calendar::day_bucket(event.timestamp);
  switch (tier) {
    case strata::schema::counter_tier_t::fine:
      return strata::schema::key::make_fine_key(
          schema, event.subject_id, event.scope_id, event.type, day);
    case strata::schema::counter_tier_t::medium:
      return strata::schema::key::make_medium_key(
          schema, event.subject_id, event.scope_id, event.type,
          strata::schema::calendar::month_bucket(day));
    case strata::schema::counter_tier_t::total:
      return strata::schema::key::make_total_key(schema, event.subject_id,
                                                 event.scope_id, event.type);
  }
  strata::common::critical("unknown counter tier");
}

void add_to_counter(encoder_t& encoder,
                    transaction_t& transaction,
                    const strata::schema::bytes_t& key,
                    const strata::schema::count_t delta) {
  auto current =
      transaction.get_for_update<strata::schema::count_t>(encoder, key);
  transaction.put(encoder, key, current.value_or(0) + delta);
}

std::map<strata::schema::timestamp_milliseconds_t,
         strata::schema::counter_tier_t>
read_tiers(encoder_t& encoder,
           const read_view_t& view,
           const std::string& schema) {
  auto tiers = std::map<strata::schema::timestamp_milliseconds_t,
                        strata::schema::counter_tier_t>{};
  auto prefix = strata::schema::key::make_keyspace_prefix(
      schema, strata::schema::key::kTierKeyPrefix);
  for (const auto& [key, value] : view.list_by_prefix(prefix)) {
    if (key.size() != prefix.size() + sizeof(uint64_t)) {
      continue;
    }
    auto month = strata::schema::key::read_integral<
        strata::schema::timestamp_milliseconds_t>(key, prefix.size());
    tiers[month] = decode_tier(encoder, strata::schema::bytes_view_t{value});
  }
  return tiers;
}

template <typename Row, typename Parse>
std::vector<Row> read_rows(encoder_t& encoder,
                           const read_view_t& view,
                           const strata::schema::bytes_t& prefix,
                           Parse&& parse) {
  auto rows = std::vector<Row>{};
  for (const auto& [key, value] : view.list_by_prefix(prefix)) {
    auto row = parse(strata::schema::bytes_view_t{key});
    if (!row) {
      spdlog::warn("Skipping malformed counter key {}",
                   strata::schema::to_hex(key));
      continue;
    }
    row->count = encoder.decode<strata::schema::count_t>(
        strata::schema::bytes_view_t{value});
    rows.push_back(*row);
  }
  return rows;
}

}  // namespace

strata::schema::counter_tier_t decode_tier(
    encoder_t& encoder,
    const strata::schema::bytes_view_t& value) {
  auto raw = encoder.decode<uint8_t>(value);
  if (raw > static_cast<uint8_t>(strata::schema::counter_tier_t::total)) {
    strata::common::critical("unknown counter tier {} in tier marker", raw);
  }
  return static_cast<strata::schema::counter_tier_t>(raw);
}

strata::schema::counter_tier_t counter_snapshot_t::tier_of(
    const strata::schema::timestamp_milliseconds_t month_bucket) const {
  auto it = tiers.find(month_bucket);
  if (it == std::end(tiers)) {
    return strata::schema::counter_tier_t::fine;
  }
  return it->second;
}

counter_store::counter_store(
    encoder_t& encoder,
    strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
    std::string schema)
    : encoder_{encoder}, storage_{storage}, schema_{std::move(schema)} {}

void counter_store::set_identity_guard(identity_guard_t guard) {
  identity_guard_ = std::move(guard);
}

void counter_store::check_identity(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  if (identity_guard_ && !identity_guard_(subject, scope)) {
    throw strata::common::integrity_violation{
        fmt::format("unknown identity pair subject={} scope={}", subject,
                    scope)};
  }
}

void counter_store::increment(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope,
    const strata::schema::counter_type_t type,
    const strata::schema::timestamp_milliseconds_t timestamp,
    const strata::schema::count_t delta) {
  increment_batch({strata::schema::counter_event_t{.subject_id = subject,
                                                   .scope_id = scope,
                                                   .type = type,
                                                   .timestamp = timestamp,
                                                   .delta = delta}});
}

void counter_store::increment_batch(
    const std::vector<strata::schema::counter_event_t>& events) {
  if (events.empty()) {
    return;
  }
  for (const auto& event : events) {
    check_identity(event.subject_id, event.scope_id);
  }

  storage_.transact([&](transaction_t& transaction) {
    // Tier markers are locked in ascending month order before any counter
    // row, the same order the rollup uses.
    auto months = std::set<strata::schema::timestamp_milliseconds_t>{};
    for (const auto& event : events) {
      months.insert(strata::schema::calendar::month_bucket(
          strata::schema::calendar::day_bucket(event.timestamp)));
    }
    auto tiers = std::map<strata::schema::timestamp_milliseconds_t,
                          strata::schema::counter_tier_t>{};
    for (const auto month : months) {
      tiers[month] = lock_tier(encoder_, transaction, schema_, month);
    }

    auto deltas = std::map<strata::schema::bytes_t, strata::schema::count_t>{};
    for (const auto& event : events) {
      if (event.delta == 0) {
        continue;
      }
      auto month = strata::schema::calendar::month_bucket(
          strata::schema::calendar::day_bucket(event.timestamp));
      deltas[resolve_counter_key(schema_, event, tiers[month])] += event.delta;
    }
    for (const auto& [key, delta] : deltas) {
      add_to_counter(encoder_, transaction, key, delta);
    }
  });

  spdlog::debug("Applied {} counter increments to schema '{}'", events.size(),
                schema_);
}

void counter_store::purge_subject(const strata::schema::subject_id_t subject) {
  auto deleted = storage_.transact([&](transaction_t& transaction) {
    auto removed = std::size_t{};
    auto remove_prefix = [&](const strata::schema::bytes_t& prefix) {
      for (const auto& [key, _] : transaction.list_by_prefix(prefix)) {
        transaction.remove(key);
        ++removed;
      }
    };
    for (const auto keyspace :
         {strata::schema::key::kFineKeyPrefix,
          strata::schema::key::kMediumKeyPrefix,
          strata::schema::key::kTotalKeyPrefix,
          strata::schema::key::kHistoryKeyPrefix,
          strata::schema::key::kHistorySequencePrefix}) {
      remove_prefix(
          strata::schema::key::make_owner_prefix(schema_, keyspace, subject));
    }
    return removed;
  });
  spdlog::info("Purged {} rows owned by subject {} from schema '{}'", deleted,
               subject, schema_);
}

void counter_store::purge_scope(const strata::schema::scope_id_t scope) {
  auto deleted = storage_.transact([&](transaction_t& transaction) {
    auto removed = std::size_t{};
    auto remove_matching = [&](const std::string_view keyspace,
                               auto&& parse) {
      auto prefix = strata::schema::key::make_keyspace_prefix(schema_, keyspace);
      for (const auto& [key, _] : transaction.list_by_prefix(prefix)) {
        auto row = parse(strata::schema::bytes_view_t{key});
        if (row && row->scope_id == scope) {
          transaction.remove(key);
          ++removed;
        }
      }
    };
    remove_matching(strata::schema::key::kFineKeyPrefix,
                    [&](const strata::schema::bytes_view_t& key) {
                      return strata::schema::key::parse_fine_key(schema_, key);
                    });
    remove_matching(strata::schema::key::kMediumKeyPrefix,
                    [&](const strata::schema::bytes_view_t& key) {
                      return strata::schema::key::parse_medium_key(schema_,
                                                                   key);
                    });
    remove_matching(strata::schema::key::kTotalKeyPrefix,
                    [&](const strata::schema::bytes_view_t& key) {
                      return strata::schema::key::parse_total_key(schema_, key);
                    });
    return removed;
  });
  spdlog::info("Purged {} counter rows owned by scope {} from schema '{}'",
               deleted, scope, schema_);
}

counter_snapshot_t counter_store::snapshot(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  return storage_.read([&](const read_view_t& view) {
    auto result = counter_snapshot_t{};
    result.fine = read_rows<strata::schema::fine_counter_t>(
        encoder_, view,
        strata::schema::key::make_owner_prefix(
            schema_, strata::schema::key::kFineKeyPrefix, subject, scope),
        [&](const strata::schema::bytes_view_t& key) {
          return strata::schema::key::parse_fine_key(schema_, key);
        });
    result.medium = read_rows<strata::schema::medium_counter_t>(
        encoder_, view,
        strata::schema::key::make_owner_prefix(
            schema_, strata::schema::key::kMediumKeyPrefix, subject, scope),
        [&](const strata::schema::bytes_view_t& key) {
          return strata::schema::key::parse_medium_key(schema_, key);
        });
    result.total = read_rows<strata::schema::total_counter_t>(
        encoder_, view,
        strata::schema::key::make_owner_prefix(
            schema_, strata::schema::key::kTotalKeyPrefix, subject, scope),
        [&](const strata::schema::bytes_view_t& key) {
          return strata::schema::key::parse_total_key(schema_, key);
        });
    result.tiers = read_tiers(encoder_, view, schema_);
    return result;
  });
}

std::vector<strata::schema::fine_counter_t> counter_store::fine_rows(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  return snapshot(subject, scope).fine;
}

std::vector<strata::schema::medium_counter_t> counter_store::medium_rows(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  return snapshot(subject, scope).medium;
}

std::vector<strata::schema::total_counter_t> counter_store::total_rows(
    const strata::schema::subject_id_t subject,
    const strata::schema::scope_id_t scope) const {
  return snapshot(subject, scope).total;
}

strata::schema::counter_tier_t counter_store::tier_of(
    const strata::schema::timestamp_milliseconds_t month_bucket) const {
  return storage_.read([&](const read_view_t& view) {
    auto raw = view.get(strata::schema::key::make_tier_key(schema_, month_bucket));
    if (!raw) {
      return strata::schema::counter_tier_t::fine;
    }
    return decode_tier(encoder_, strata::schema::bytes_view_t{*raw});
  });
}

}  // namespace strata::counters
