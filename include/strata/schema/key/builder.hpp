#pragma once
#include <boost/endian/conversion.hpp>
#include <strata/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace strata::schema::key {

/// Byte-wise key assembler. Integers are written big-endian so that RocksDB's
/// lexicographic order matches numeric order within a keyspace.
struct builder final {
  strata::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

/// Read a big-endian integer written by builder::write at `offset`.
template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
T read_integral(const strata::schema::bytes_view_t& key,
                const std::size_t offset) {
  auto value = T{};
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value = static_cast<T>((value << 8u) | key[offset + i]);
  }
  return value;
}

}  // namespace strata::schema::key
