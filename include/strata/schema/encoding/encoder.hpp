#pragma once
#include <strata/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strata::schema::encoding {

// The value codec is chosen at build time by tag, the same way the storage
// backend is. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  strata::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const strata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strata::schema::bytes_view_t& bytes);
};

}  // namespace strata::schema::encoding
