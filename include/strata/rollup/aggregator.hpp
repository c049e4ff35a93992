#pragma once

#include <strata/common/clock.hpp>
#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/period_token.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/schema/rollup_report.hpp>
#include <strata/storage/rocksdb/storage.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace strata::rollup {

/// Window [start, end) a rollup of `token` evaluated at `now` consumes.
std::pair<strata::schema::timestamp_milliseconds_t,
          strata::schema::timestamp_milliseconds_t>
rollup_window(strata::schema::period_token_t token,
              strata::schema::timestamp_milliseconds_t now);

/// Promotes counters one tier up.
///
/// `month` sums last month's fine rows into medium rows; `year` sums last
/// year's medium rows into total rows. The sum, upsert and delete run in one
/// transaction that holds the window's tier markers exclusively, so a
/// concurrent increment either commits before the rollup (and is summed) or
/// after it (and lands in the promoted tier). A second run over a consumed
/// window finds nothing to move.
class aggregator final {
 public:
  explicit aggregator(
      strata::schema::encoding::encoder<
          strata::schema::encoding::scale_encoder_tag>& encoder,
      strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage,
      std::string schema,
      strata::common::clock_fn_t clock = strata::common::system_clock());

  /// Throws strata::common::configuration_error for an unknown token before
  /// touching storage.
  strata::schema::rollup_report_t aggregate(std::string_view token);
  strata::schema::rollup_report_t aggregate(std::string_view token,
                                            strata::schema::timestamp_milliseconds_t now);
  strata::schema::rollup_report_t aggregate(strata::schema::period_token_t token);
  strata::schema::rollup_report_t aggregate(
      strata::schema::period_token_t token,
      strata::schema::timestamp_milliseconds_t now);

  /// The instant aggregate(token) evaluates its window at.
  strata::schema::timestamp_milliseconds_t now() const { return clock_(); }

 private:
  strata::schema::rollup_report_t rollup_months(
      strata::schema::timestamp_milliseconds_t start,
      strata::schema::timestamp_milliseconds_t end);
  strata::schema::rollup_report_t rollup_year(
      strata::schema::timestamp_milliseconds_t start,
      strata::schema::timestamp_milliseconds_t end);

  strata::schema::encoding::encoder<
      strata::schema::encoding::scale_encoder_tag>& encoder_;
  strata::storage::storage<strata::storage::rocksdb_storage_tag>& storage_;
  std::string schema_;
  strata::common::clock_fn_t clock_;
};

}  // namespace strata::rollup
