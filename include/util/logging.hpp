// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_LOGGING_HPP
#define TIMECHUNK_UTIL_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace timechunk {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the library.
 *
 * Thread-safety: All methods are thread-safe. Logger access and
 * (re)initialization are protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (chunk, link, validation, store, app, default)
   *
   * Auto-initializes if not initialized. Unknown names get the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  static bool IsInitialized();
};

} // namespace util
} // namespace timechunk

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  timechunk::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  timechunk::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  timechunk::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  timechunk::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  timechunk::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHUNK_TRACE(...)                                                   \
  timechunk::util::LogManager::GetLogger("chunk")->trace(__VA_ARGS__)
#define LOG_CHUNK_DEBUG(...)                                                   \
  timechunk::util::LogManager::GetLogger("chunk")->debug(__VA_ARGS__)
#define LOG_CHUNK_INFO(...)                                                    \
  timechunk::util::LogManager::GetLogger("chunk")->info(__VA_ARGS__)
#define LOG_CHUNK_WARN(...)                                                    \
  timechunk::util::LogManager::GetLogger("chunk")->warn(__VA_ARGS__)
#define LOG_CHUNK_ERROR(...)                                                   \
  timechunk::util::LogManager::GetLogger("chunk")->error(__VA_ARGS__)

#define LOG_LINK_TRACE(...)                                                    \
  timechunk::util::LogManager::GetLogger("link")->trace(__VA_ARGS__)
#define LOG_LINK_DEBUG(...)                                                    \
  timechunk::util::LogManager::GetLogger("link")->debug(__VA_ARGS__)
#define LOG_LINK_INFO(...)                                                     \
  timechunk::util::LogManager::GetLogger("link")->info(__VA_ARGS__)
#define LOG_LINK_WARN(...)                                                     \
  timechunk::util::LogManager::GetLogger("link")->warn(__VA_ARGS__)
#define LOG_LINK_ERROR(...)                                                    \
  timechunk::util::LogManager::GetLogger("link")->error(__VA_ARGS__)

#define LOG_VALIDATION_TRACE(...)                                              \
  timechunk::util::LogManager::GetLogger("validation")->trace(__VA_ARGS__)
#define LOG_VALIDATION_DEBUG(...)                                              \
  timechunk::util::LogManager::GetLogger("validation")->debug(__VA_ARGS__)
#define LOG_VALIDATION_INFO(...)                                               \
  timechunk::util::LogManager::GetLogger("validation")->info(__VA_ARGS__)
#define LOG_VALIDATION_WARN(...)                                               \
  timechunk::util::LogManager::GetLogger("validation")->warn(__VA_ARGS__)
#define LOG_VALIDATION_ERROR(...)                                              \
  timechunk::util::LogManager::GetLogger("validation")->error(__VA_ARGS__)

#define LOG_STORE_TRACE(...)                                                   \
  timechunk::util::LogManager::GetLogger("store")->trace(__VA_ARGS__)
#define LOG_STORE_DEBUG(...)                                                   \
  timechunk::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  timechunk::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  timechunk::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  timechunk::util::LogManager::GetLogger("store")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  timechunk::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  timechunk::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  timechunk::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  timechunk::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

#endif // TIMECHUNK_UTIL_LOGGING_HPP
