// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace serverbook {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the library and the CLI.
 *
 * Thread-safety: All methods are thread-safe. Initialization and logger
 * access are protected by a single mutex.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Multiple calls are safe; only the first call after startup (or after
  // Shutdown) performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component ("store", "app").
  // Auto-initializes if not initialized. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (store, app, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace serverbook

// Convenience macros for logging
#define LOG_TRACE(...) serverbook::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) serverbook::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) serverbook::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) serverbook::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) serverbook::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_STORE_TRACE(...) serverbook::util::LogManager::GetLogger("store")->trace(__VA_ARGS__)
#define LOG_STORE_DEBUG(...) serverbook::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...) serverbook::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...) serverbook::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...) serverbook::util::LogManager::GetLogger("store")->error(__VA_ARGS__)

#define LOG_APP_TRACE(...) serverbook::util::LogManager::GetLogger("app")->trace(__VA_ARGS__)
#define LOG_APP_DEBUG(...) serverbook::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) serverbook::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) serverbook::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) serverbook::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite. Every store mutation persists to disk, so
// a read-only or full disk would otherwise produce one error line per click.
//
// Rate limits (token bucket):
// - 200 messages per hour per callsite
//
// When to use:
// - Save failures (repeat on every mutation)
// - Skipped entries while loading a damaged file
// - Not for startup/shutdown messages

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_ERROR_RL(...)                                                                                              \
  do {                                                                                                                 \
    if (serverbook::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      serverbook::util::LogManager::GetLogger()->error(__VA_ARGS__);                                                   \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (serverbook::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      serverbook::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                    \
    }                                                                                                                  \
  } while (0)

#define LOG_STORE_ERROR_RL(...)                                                                                        \
  do {                                                                                                                 \
    if (serverbook::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      serverbook::util::LogManager::GetLogger("store")->error(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_STORE_WARN_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (serverbook::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                              \
      serverbook::util::LogManager::GetLogger("store")->warn(__VA_ARGS__);                                             \
    }                                                                                                                  \
  } while (0)
