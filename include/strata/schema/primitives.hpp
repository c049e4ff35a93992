#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace strata::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using subject_id_t = uint64_t;  // Identity store reference (user snowflake)
using scope_id_t = uint64_t;    // Identity store reference (guild snowflake)
using timestamp_milliseconds_t = uint64_t;
using count_t = uint64_t;

/// Lowercase hex, two characters per byte. Used to name keys in log lines
/// and errors.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace strata::schema
