#pragma once

#include <stdexcept>
#include <string>

// Error taxonomy shared by the counter store, rollup and scheduler.
// Unrecoverable storage faults do not use these; they go through
// strata::common::critical.
namespace strata::common {

class error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Invalid period token, cron expression, timezone or option value.
/// Always raised before any side effect.
class configuration_error final : public error {
 public:
  using error::error;
};

/// Lock contention, timeout, expiration or I/O failure inside a transaction.
/// The transaction has been rolled back; retry at the next natural occurrence.
class transient_store_error final : public error {
 public:
  using error::error;
};

/// Foreign-key rejection or duplicate key. The transaction has been rolled
/// back.
class integrity_violation final : public error {
 public:
  using error::error;
};

}  // namespace strata::common
