#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace leasehold::common {

/// Unrecoverable fault raised inside `codespace` (the same component names
/// operation results carry). Flushes the logs and brings the process down.
[[noreturn]] inline void critical(const std::string_view codespace,
                                  const std::string_view message) {
  spdlog::critical("[{}] {}", codespace, message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace leasehold::common
