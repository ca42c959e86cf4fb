#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bounty::common {

/// Log, flush and terminate. Reserved for faults the engine cannot recover
/// from (storage I/O failure, undecodable persisted rows).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace bounty::common
