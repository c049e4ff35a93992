#include <strata/common/critical.hpp>
#include <strata/storage/rocksdb/storage.hpp>

namespace strata::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.options = options;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = true;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  auto transaction_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  transaction_db_options.transaction_lock_timeout = options.lock_timeout_ms;
  transaction_db_options.default_lock_timeout = options.lock_timeout_ms;

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      db_options, transaction_db_options, std::string{path}, &database);
  if (!status.ok()) {
    strata::common::critical("Failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {} (lock timeout {} ms)", path,
               options.lock_timeout_ms);
  store.database.reset(database);

  return store;
}
}  // namespace strata::storage
