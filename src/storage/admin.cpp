#include <spdlog/spdlog.h>
#include <strata/common/error.hpp>
#include <strata/schema/key/counter_keys.hpp>
#include <strata/storage/admin.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace strata::storage::admin {

bool is_valid_schema_name(const std::string_view schema) {
  return !schema.empty() &&
         std::ranges::all_of(schema, [](const char ch) {
           return std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
                  ch == '_';
         });
}

std::size_t drop_schema(const storage<rocksdb_storage_tag>& store,
                        const std::string_view schema) {
  if (!is_valid_schema_name(schema)) {
    throw strata::common::configuration_error{"invalid schema name '" +
                                              std::string{schema} + "'"};
  }
  spdlog::warn("Dropping every table in schema '{}'", schema);
  auto prefix = strata::schema::key::make_schema_prefix(schema);
  auto deleted = store.delete_by_prefix(
      strata::schema::bytes_view_t{prefix.data(), prefix.size()});
  spdlog::warn("Dropped schema '{}' ({} keys removed)", schema, deleted);
  return deleted;
}

}  // namespace strata::storage::admin
