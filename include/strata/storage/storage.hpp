#pragma once
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::storage {

using key_value_entry_t =
    std::pair<strata::schema::bytes_t, strata::schema::bytes_t>;

/// Tuning for transactional writes.
struct storage_options final {
  /// How long a transaction waits for a point lock before failing.
  int64_t lock_timeout_ms{1000};
  /// Upper bound on a transaction's lifetime; commit after expiry fails.
  int64_t transaction_timeout_ms{10000};
};

/// Read-write scope of one pessimistic transaction. Writes become visible
/// only when the enclosing storage::transact commits.
template <typename Library>
struct transaction {
  /// Read the committed value at key and lock it. Exclusive locks serialise
  /// writers; shared locks only exclude exclusive holders.
  std::optional<strata::schema::bytes_t> get_for_update(
      const strata::schema::bytes_view_t& key,
      bool exclusive = true);

  /// Decode the value at key after locking it.
  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const strata::schema::bytes_view_t& key,
                                  bool exclusive = true);

  /// Encode and stage value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strata::schema::bytes_view_t& key,
           const T& value);

  /// Stage deletion of key.
  void remove(const strata::schema::bytes_view_t& key);

  /// Return all key-value pairs under prefix, including this transaction's
  /// staged writes. Does not lock.
  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix);
};

/// Consistent point-in-time read view.
template <typename Library>
struct read_view {
  std::optional<strata::schema::bytes_t> get(
      const strata::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;
};

template <typename Library>
struct storage {
  /// Run fn(transaction&) and commit. Any exception thrown by fn, and any
  /// commit failure, rolls the transaction back. Lock timeouts, expiry and
  /// I/O failures raise strata::common::transient_store_error.
  template <typename Fn>
  auto transact(Fn&& fn);

  /// Run fn(const read_view&) against one snapshot.
  template <typename Fn>
  auto read(Fn&& fn) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;

  /// Atomically delete every key under prefix. Returns the number deleted.
  std::size_t delete_by_prefix(const strata::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options& options = {});

}  // namespace strata::storage
