// Copyright (c) 2025 The ircguard developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ircguard {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "ircguard.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("network", "relay", "app")
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, relay, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  // True if the component name is one of the known loggers
  static bool IsKnownComponent(const std::string &component);
};

} // namespace util
} // namespace ircguard

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  ircguard::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  ircguard::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  ircguard::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  ircguard::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  ircguard::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  ircguard::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  ircguard::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  ircguard::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  ircguard::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  ircguard::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...)                                                   \
  ircguard::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...)                                                   \
  ircguard::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_INFO(...)                                                    \
  ircguard::util::LogManager::GetLogger("relay")->info(__VA_ARGS__)
#define LOG_RELAY_WARN(...)                                                    \
  ircguard::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)
#define LOG_RELAY_ERROR(...)                                                   \
  ircguard::util::LogManager::GetLogger("relay")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  ircguard::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  ircguard::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  ircguard::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
