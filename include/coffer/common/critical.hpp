#pragma once

#include <csignal>
#include <exception>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace coffer::common {

/// Log an unrecoverable fault, flush every logger and terminate. Used where
/// the ledger's storage or codec can no longer be trusted.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("fatal: {}", message);
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
    logger->flush();
  });
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace coffer::common
