#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/counters/counter_store.hpp>
#include <strata/rollup/aggregator.hpp>
#include <strata/schema/calendar.hpp>
#include <strata/schema/counter_tier.hpp>
#include <strata/schema/key/counter_keys.hpp>

#include <map>
#include <vector>

namespace strata::rollup {

namespace {

using encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;
using transaction_t =
    strata::storage::transaction<strata::storage::rocksdb_storage_tag>;
using strata::schema::counter_tier_t;
using strata::schema::timestamp_milliseconds_t;

/// Exclusively lock the tier marker of every month in [start, end), in
/// ascending order, and return what each currently holds.
std::map<timestamp_milliseconds_t, counter_tier_t> lock_window(
    encoder_t& encoder,
    transaction_t& transaction,
    const std::string& schema,
    const timestamp_milliseconds_t start,
    const timestamp_milliseconds_t end) {
  auto tiers = std::map<timestamp_milliseconds_t, counter_tier_t>{};
  for (auto month = start; month < end;
       month = strata::schema::calendar::add_months(month, 1)) {
    auto raw = transaction.get_for_update(
        strata::schema::key::make_tier_key(schema, month));
    tiers[month] = raw ? strata::counters::decode_tier(
                             encoder, strata::schema::bytes_view_t{*raw})
                       : counter_tier_t::fine;
  }
  return tiers;
}

/// Sum every source row selected by `route` into its destination key and
/// stage the source for deletion. `route` returns the destination key, or
/// std::nullopt to leave the row alone.
template <typename Route>
strata::schema::rollup_report_t promote(encoder_t& encoder,
                                        transaction_t& transaction,
                                        const strata::schema::bytes_t& prefix,
                                        Route&& route) {
  auto report = strata::schema::rollup_report_t{};
  auto groups = std::map<strata::schema::bytes_t, strata::schema::count_t>{};
  for (const auto& [key, _] : transaction.list_by_prefix(prefix)) {
    auto destination = route(strata::schema::bytes_view_t{key});
    if (!destination) {
      continue;
    }
    auto count = transaction.get_for_update<strata::schema::count_t>(encoder, key);
    if (!count) {
      continue;
    }
    groups[*destination] += *count;
    report.mass_moved += *count;
    transaction.remove(key);
    ++report.rows_deleted;
  }

  for (const auto& [destination, sum] : groups) {
    auto current =
        transaction.get_for_update<strata::schema::count_t>(encoder, destination);
    transaction.put(encoder, destination, current.value_or(0) + sum);
  }
  report.groups = groups.size();
  return report;
}

void write_tier(encoder_t& encoder,
                transaction_t& transaction,
                const std::string& schema,
                const timestamp_milliseconds_t month,
                const counter_tier_t tier) {
  transaction.put(encoder, strata::schema::key::make_tier_key(schema, month),
                  static_cast<uint8_t>(tier));
}

}  // namespace

std::pair<timestamp_milliseconds_t, timestamp_milliseconds_t> rollup_window(
    const strata::schema::period_token_t token,
    const timestamp_milliseconds_t now) {
  auto today = strata::schema::calendar::day_bucket(now);
  switch (token) {
    case strata::schema::period_token_t::month: {
      auto end = strata::schema::calendar::month_bucket(today);
      return {strata::schema::calendar::add_months(end, -1), end};
    }
    case strata::schema::period_token_t::year: {
      auto end = strata::schema::calendar::year_bucket(today);
      return {strata::schema::calendar::add_years(end, -1), end};
    }
  }
  throw strata::common::configuration_error{"unknown period token"};
}

aggregator::aggregator(
    encoder_t& encoder,
    strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
    std::string schema,
    strata::common::clock_fn_t clock)
    : encoder_{encoder},
      storage_{storage},
      schema_{std::move(schema)},
      clock_{std::move(clock)} {}

strata::schema::rollup_report_t aggregator::aggregate(
    const std::string_view token) {
  return aggregate(token, clock_());
}

strata::schema::rollup_report_t aggregator::aggregate(
    const std::string_view token,
    const timestamp_milliseconds_t now) {
  auto parsed =
      strata::schema::try_from_string<strata::schema::period_token_t>(token);
  if (!parsed) {
    throw strata::common::configuration_error{
        fmt::format("unknown period token '{}'", token)};
  }
  return aggregate(*parsed, now);
}

strata::schema::rollup_report_t aggregator::aggregate(
    const strata::schema::period_token_t token) {
  return aggregate(token, clock_());
}

strata::schema::rollup_report_t aggregator::aggregate(
    const strata::schema::period_token_t token,
    const timestamp_milliseconds_t now) {
  auto [start, end] = rollup_window(token, now);
  spdlog::debug("Starting {} rollup of [{}, {}) in schema '{}'",
                strata::schema::to_string(token),
                strata::schema::calendar::to_iso_string(start),
                strata::schema::calendar::to_iso_string(end), schema_);

  auto report = token == strata::schema::period_token_t::month
                    ? rollup_months(start, end)
                    : rollup_year(start, end);
  report.token = token;
  report.window_start = start;
  report.window_end = end;

  spdlog::info(
      "Committed {} rollup of [{}, {}): {} groups, {} rows deleted, {} moved",
      strata::schema::to_string(token),
      strata::schema::calendar::to_iso_string(start),
      strata::schema::calendar::to_iso_string(end), report.groups,
      report.rows_deleted, report.mass_moved);
  return report;
}

strata::schema::rollup_report_t aggregator::rollup_months(
    const timestamp_milliseconds_t start,
    const timestamp_milliseconds_t end) {
  return storage_.transact([&](transaction_t& transaction) {
    auto tiers = lock_window(encoder_, transaction, schema_, start, end);
    auto report = promote(
        encoder_, transaction,
        strata::schema::key::make_keyspace_prefix(
            schema_, strata::schema::key::kFineKeyPrefix),
        [&](const strata::schema::bytes_view_t& key)
            -> std::optional<strata::schema::bytes_t> {
          auto row = strata::schema::key::parse_fine_key(schema_, key);
          if (!row || row->day_bucket < start || row->day_bucket >= end) {
            return std::nullopt;
          }
          return strata::schema::key::make_medium_key(
              schema_, row->subject_id, row->scope_id, row->type,
              strata::schema::calendar::month_bucket(row->day_bucket));
        });
    for (const auto& [month, tier] : tiers) {
      if (tier == counter_tier_t::fine) {
        write_tier(encoder_, transaction, schema_, month,
                   counter_tier_t::medium);
      }
    }
    return report;
  });
}

strata::schema::rollup_report_t aggregator::rollup_year(
    const timestamp_milliseconds_t start,
    const timestamp_milliseconds_t end) {
  return storage_.transact([&](transaction_t& transaction) {
    auto tiers = lock_window(encoder_, transaction, schema_, start, end);
    // Total rows carry no date, so months before counting began stay medium.
    auto counted = [](const timestamp_milliseconds_t month) {
      return month >= strata::schema::calendar::kCountingEpoch;
    };
    auto report = promote(
        encoder_, transaction,
        strata::schema::key::make_keyspace_prefix(
            schema_, strata::schema::key::kMediumKeyPrefix),
        [&](const strata::schema::bytes_view_t& key)
            -> std::optional<strata::schema::bytes_t> {
          auto row = strata::schema::key::parse_medium_key(schema_, key);
          if (!row || row->month_bucket < start || row->month_bucket >= end) {
            return std::nullopt;
          }
          if (!counted(row->month_bucket)) {
            return std::nullopt;
          }
          return strata::schema::key::make_total_key(
              schema_, row->subject_id, row->scope_id, row->type);
        });
    // Months never rolled into the medium tier keep their fine rows and stay
    // attributable to day buckets.
    for (const auto& [month, tier] : tiers) {
      if (tier == counter_tier_t::medium && counted(month)) {
        write_tier(encoder_, transaction, schema_, month,
                   counter_tier_t::total);
      } else if (tier == counter_tier_t::fine) {
        spdlog::debug("Month {} was never rolled up; its fine rows stay in place",
                     strata::schema::calendar::to_iso_string(month));
      }
    }
    return report;
  });
}

}  // namespace strata::rollup
