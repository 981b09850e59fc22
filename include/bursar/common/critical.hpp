#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace bursar::common {

/// Report an internal failure the ledger cannot recover from, flush every
/// logger, and stop the process. Balances computed so far are not printed.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format, Args&&... args) {
  spdlog::critical("Ledger halted: {}",
                   fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace bursar::common
