// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace chainsync {
namespace util {

/**
 * LogManager - process-wide spdlog configuration
 *
 * Component loggers: "default" and "sync". Both share one
 * sink (colored stdout, or an append-mode file).
 *
 * Thread-safety: all methods take the registry mutex. Initialize() only has
 * an effect on the first call after startup or Shutdown(). GetLogger()
 * auto-initializes with level "off" so libraries and tests can log before
 * the host configures anything.
 */
class LogManager {
public:
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "sync.log");

  // Flush and drop all loggers. A later GetLogger() re-creates them.
  static void Shutdown();

  // Unknown component names map to the "default" logger
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);
  static void SetComponentLevel(const std::string& component, const std::string& level);

  // Whether a message at level would be emitted by component's logger
  static bool IsEnabled(const std::string& component, spdlog::level::level_enum level);
};

}  // namespace util
}  // namespace chainsync

#define LOG_TRACE(...) chainsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_ERROR(...) chainsync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SYNC_TRACE(...) chainsync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...) chainsync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...) chainsync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...) chainsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...) chainsync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages a collaborator can trigger on every tick, such as connector
// failures. 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_SYNC_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (chainsync::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                               \
      chainsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)
