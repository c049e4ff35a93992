#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <strata/common/critical.hpp>
#include <strata/common/error.hpp>
#include <strata/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace strata::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const strata::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline strata::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline strata::schema::bytes_t to_bytes(const std::string& value) {
  return {std::begin(value), std::end(value)};
}

/// Contention and I/O failures are retryable; everything else means the
/// database is unusable.
inline bool is_transient(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain() ||
         status.IsExpired() || status.IsIOError() || status.IsAborted();
}

inline void check_status(const ROCKSDB_NAMESPACE::Status& status,
                         const std::string_view what) {
  if (status.ok()) {
    return;
  }
  if (is_transient(status)) {
    spdlog::warn("{}: {}", what, status.ToString());
    throw strata::common::transient_store_error{
        fmt::format("{}: {}", what, status.ToString())};
  }
  strata::common::critical("{}: {}", what, status.ToString());
}

inline std::vector<key_value_entry_t> scan_prefix(
    ROCKSDB_NAMESPACE::Iterator& iterator,
    const strata::schema::bytes_view_t& prefix) {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = to_slice(prefix);
  iterator.Seek(prefix_slice);
  while (iterator.Valid()) {
    if (!iterator.key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(
        key_value_entry_t{to_bytes(iterator.key()), to_bytes(iterator.value())});
    iterator.Next();
  }
  check_status(iterator.status(), "failed iterating RocksDB prefix");
  return entries;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  ROCKSDB_NAMESPACE::Transaction* handle{nullptr};

  std::optional<strata::schema::bytes_t> get_for_update(
      const strata::schema::bytes_view_t& key,
      bool exclusive = true);

  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const strata::schema::bytes_view_t& key,
                                  bool exclusive = true);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strata::schema::bytes_view_t& key,
           const T& value);

  void remove(const strata::schema::bytes_view_t& key);

  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix);
};

template <>
struct read_view<rocksdb_storage_tag> final {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  const ROCKSDB_NAMESPACE::Snapshot* snapshot{nullptr};

  std::optional<strata::schema::bytes_t> get(
      const strata::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  storage_options options;

  template <typename Fn>
  auto transact(Fn&& fn);

  template <typename Fn>
  auto read(Fn&& fn) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const strata::schema::bytes_view_t& prefix) const;

  std::size_t delete_by_prefix(const strata::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options);

inline std::optional<strata::schema::bytes_t>
transaction<rocksdb_storage_tag>::get_for_update(
    const strata::schema::bytes_view_t& key,
    const bool exclusive) {
  auto value = std::string{};
  auto status =
      handle->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                           detail::to_slice(key), &value, exclusive);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check_status(status, "failed to lock key in RocksDB transaction");
  return detail::to_bytes(value);
}

template <typename T, typename Encoder>
std::optional<T> transaction<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const strata::schema::bytes_view_t& key,
    const bool exclusive) {
  auto raw = get_for_update(key, exclusive);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      strata::schema::bytes_view_t{raw->data(), raw->size()})};
}

template <typename T, typename Encoder>
void transaction<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const strata::schema::bytes_view_t& key,
    const T& value) {
  auto encoded_value = encoder.encode(value);
  auto status = handle->Put(
      detail::to_slice(key),
      detail::to_slice(strata::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  detail::check_status(status, "failed to stage put in RocksDB transaction");
}

inline void transaction<rocksdb_storage_tag>::remove(
    const strata::schema::bytes_view_t& key) {
  auto status = handle->Delete(detail::to_slice(key));
  detail::check_status(status, "failed to stage delete in RocksDB transaction");
}

inline std::vector<key_value_entry_t>
transaction<rocksdb_storage_tag>::list_by_prefix(
    const strata::schema::bytes_view_t& prefix) {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle->GetIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::scan_prefix(*iterator, prefix);
}

inline std::optional<strata::schema::bytes_t>
read_view<rocksdb_storage_tag>::get(
    const strata::schema::bytes_view_t& key) const {
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot;
  auto value = std::string{};
  auto status = database->Get(read_options, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check_status(status, "failed to get value from RocksDB");
  return detail::to_bytes(value);
}

inline std::vector<key_value_entry_t>
read_view<rocksdb_storage_tag>::list_by_prefix(
    const strata::schema::bytes_view_t& prefix) const {
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  return detail::scan_prefix(*iterator, prefix);
}

template <typename Fn>
auto storage<rocksdb_storage_tag>::transact(Fn&& fn) {
  using result_t =
      std::invoke_result_t<Fn&, transaction<rocksdb_storage_tag>&>;
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }

  auto transaction_options = ROCKSDB_NAMESPACE::TransactionOptions{};
  transaction_options.lock_timeout = options.lock_timeout_ms;
  transaction_options.expiration = options.transaction_timeout_ms;
  auto handle = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
      database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{},
                                 transaction_options)};
  if (!handle) {
    strata::common::critical("RocksDB returned no transaction");
  }

  auto scope = transaction<rocksdb_storage_tag>{.handle = handle.get()};
  auto rollback = [&handle] {
    auto status = handle->Rollback();
    if (!status.ok()) {
      spdlog::warn("Failed to roll back RocksDB transaction: {}",
                   status.ToString());
    }
  };

  try {
    if constexpr (std::is_void_v<result_t>) {
      fn(scope);
      detail::check_status(handle->Commit(),
                           "failed to commit RocksDB transaction");
    } else {
      auto result = fn(scope);
      detail::check_status(handle->Commit(),
                           "failed to commit RocksDB transaction");
      return result;
    }
  } catch (...) {
    rollback();
    throw;
  }
}

template <typename Fn>
auto storage<rocksdb_storage_tag>::read(Fn&& fn) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }
  auto snapshot = ROCKSDB_NAMESPACE::ManagedSnapshot{database.get()};
  const auto view = read_view<rocksdb_storage_tag>{
      .database = database.get(), .snapshot = snapshot.snapshot()};
  return fn(view);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const strata::schema::bytes_view_t& prefix) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::scan_prefix(*iterator, prefix);
}

inline std::size_t storage<rocksdb_storage_tag>::delete_by_prefix(
    const strata::schema::bytes_view_t& prefix) const {
  if (!database) {
    strata::common::critical("RocksDB database is not initialized");
  }

  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto deleted = std::size_t{};

  iterator->Seek(prefix_slice);
  while (iterator->Valid()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    detail::check_status(batch.Delete(iterator->key()),
                         "failed deleting key during prefix removal");
    ++deleted;
    iterator->Next();
  }
  detail::check_status(iterator->status(),
                       "failed iterating RocksDB during prefix removal");

  detail::check_status(
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch),
      "failed to commit prefix removal");
  return deleted;
}

}  // namespace strata::storage
