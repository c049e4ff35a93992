#pragma once

#include <strata/schema/encoding/scale/encoder.hpp>
#include <strata/schema/primitives.hpp>
#include <strata/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace strata::testing {

using scale_encoder_t = strata::schema::encoding::encoder<
    strata::schema::encoding::scale_encoder_tag>;
using storage_t = strata::storage::storage<strata::storage::rocksdb_storage_tag>;

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline strata::schema::bytes_t make_bytes(const std::string_view text) {
  return strata::schema::bytes_t{std::begin(text), std::end(text)};
}

inline std::string make_string(const strata::schema::bytes_view_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace strata::testing
