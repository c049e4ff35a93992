#pragma once

#include <strata/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <string_view>

// Administrative operations. Nothing on a normal runtime path calls into this
// header; the daemon reaches it only through --drop-schema.
namespace strata::storage::admin {

/// Schema names are [A-Za-z0-9_]+ so that "<schema>|" never prefixes another
/// schema's keys.
bool is_valid_schema_name(std::string_view schema);

/// Delete every table (keyspace) under the named schema and nothing else.
/// Throws strata::common::configuration_error for an invalid name.
std::size_t drop_schema(const storage<rocksdb_storage_tag>& store,
                        std::string_view schema);

}  // namespace strata::storage::admin
