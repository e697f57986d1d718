// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace shapefuzz {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * for the codec, generator, mutator, registry and corpus tool.
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
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "shapefuzz.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (codec, generate, mutate, registry, app)
   *
   * Auto-initializes if not initialized. Unknown components fall back
   * to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace shapefuzz

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  shapefuzz::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  shapefuzz::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  shapefuzz::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  shapefuzz::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  shapefuzz::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_GEN_TRACE(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("generate")->trace(__VA_ARGS__)
#define LOG_GEN_DEBUG(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("generate")->debug(__VA_ARGS__)
#define LOG_GEN_WARN(...)                                                      \
  shapefuzz::util::LogManager::GetLogger("generate")->warn(__VA_ARGS__)

#define LOG_MUT_TRACE(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("mutate")->trace(__VA_ARGS__)
#define LOG_MUT_DEBUG(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("mutate")->debug(__VA_ARGS__)

#define LOG_CODEC_TRACE(...)                                                   \
  shapefuzz::util::LogManager::GetLogger("codec")->trace(__VA_ARGS__)
#define LOG_CODEC_WARN(...)                                                    \
  shapefuzz::util::LogManager::GetLogger("codec")->warn(__VA_ARGS__)

#define LOG_REG_DEBUG(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("registry")->debug(__VA_ARGS__)
#define LOG_REG_ERROR(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("registry")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  shapefuzz::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  shapefuzz::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  shapefuzz::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
