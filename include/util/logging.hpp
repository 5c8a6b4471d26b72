// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace synclink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("default", "network", "nat", "config").
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
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "synclink.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (network, nat, config, default)
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a specific component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace synclink

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  synclink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  synclink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  synclink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  synclink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  synclink::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  synclink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  synclink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  synclink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  synclink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  synclink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_NAT_TRACE(...)                                                     \
  synclink::util::LogManager::GetLogger("nat")->trace(__VA_ARGS__)
#define LOG_NAT_DEBUG(...)                                                     \
  synclink::util::LogManager::GetLogger("nat")->debug(__VA_ARGS__)
#define LOG_NAT_INFO(...)                                                      \
  synclink::util::LogManager::GetLogger("nat")->info(__VA_ARGS__)
#define LOG_NAT_WARN(...)                                                      \
  synclink::util::LogManager::GetLogger("nat")->warn(__VA_ARGS__)

#define LOG_CONFIG_DEBUG(...)                                                  \
  synclink::util::LogManager::GetLogger("config")->debug(__VA_ARGS__)
#define LOG_CONFIG_WARN(...)                                                   \
  synclink::util::LogManager::GetLogger("config")->warn(__VA_ARGS__)
