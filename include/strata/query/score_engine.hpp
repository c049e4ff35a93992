#pragma once

#include <strata/common/clock.hpp>
#include <strata/counters/counter_store.hpp>
#include <strata/schema/counter_type.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/score.hpp>
#include <optional>

namespace strata::query {

/// Half-open interval [start, end) over event timestamps.
struct bucket_t final {
  strata::schema::timestamp_milliseconds_t start{};
  strata::schema::timestamp_milliseconds_t end{};
};

/// Sum of the counts a snapshot attributes to `bucket`. Fine rows count by
/// day; a medium-tier month counts only when the bucket covers all of it;
/// total-tier months are never attributable to a bounded bucket.
strata::schema::count_t sum_bucket(
    const strata::counters::counter_snapshot_t& snapshot,
    const bucket_t& bucket,
    std::optional<strata::schema::counter_type_t> type = std::nullopt);

/// [kCountingEpoch, now): fine and medium rows whose bucket starts in that
/// range, plus every total row. The year rollup only moves months from the
/// epoch on into the total tier, and total rows hold no date to bound by
/// `now`.
strata::schema::count_t sum_all_time(
    const strata::counters::counter_snapshot_t& snapshot,
    strata::schema::timestamp_milliseconds_t now,
    std::optional<strata::schema::counter_type_t> type = std::nullopt);

/// Computes the nine score buckets from one consistent snapshot, reading
/// whichever tier currently holds each month.
class score_engine final {
 public:
  explicit score_engine(
      const strata::counters::counter_store& store,
      strata::common::clock_fn_t clock = strata::common::system_clock());

  strata::schema::score_t get_score(strata::schema::subject_id_t subject,
                                    strata::schema::scope_id_t scope) const;
  strata::schema::score_t get_score(
      strata::schema::subject_id_t subject,
      strata::schema::scope_id_t scope,
      strata::schema::counter_type_t type) const;
  strata::schema::score_t get_score(
      strata::schema::subject_id_t subject,
      strata::schema::scope_id_t scope,
      std::optional<strata::schema::counter_type_t> type,
      strata::schema::timestamp_milliseconds_t now) const;

 private:
  const strata::counters::counter_store& store_;
  strata::common::clock_fn_t clock_;
};

}  // namespace strata::query
