#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace flywheel::common {

/// Log and terminate. Reserved for infrastructure failures (storage
/// corruption, unwritable database) the ledger cannot roll back from.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace flywheel::common
