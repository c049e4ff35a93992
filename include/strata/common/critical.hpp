#pragma once

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <utility>

namespace strata::common {

/// Logs an unrecoverable fault, flushes every logger and aborts. For faults
/// that leave the store unusable (open failure, corrupt value, unexpected
/// RocksDB status); recoverable conditions throw strata::common::error.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::apply_all(
      [](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
  spdlog::shutdown();
  std::abort();
}

}  // namespace strata::common
