// Copyright (c) 2023, Adam Simpkins
#pragma once

#include <cstdio>

namespace nkvm {

enum class LogLevel : int {
  Verbose = 10,
  Debug = 20,
  Info = 30,
  Warning = 40,
  Error = 50,
};

#define NKVM_LOGV(arg, ...)                                                    \
  NKVM_LOG_IMPL(::nkvm::LogLevel::Verbose, arg, ##__VA_ARGS__)
#define NKVM_LOGD(arg, ...)                                                    \
  NKVM_LOG_IMPL(::nkvm::LogLevel::Debug, arg, ##__VA_ARGS__)
#define NKVM_LOGI(arg, ...)                                                    \
  NKVM_LOG_IMPL(::nkvm::LogLevel::Info, arg, ##__VA_ARGS__)
#define NKVM_LOGW(arg, ...)                                                    \
  NKVM_LOG_IMPL(::nkvm::LogLevel::Warning, arg, ##__VA_ARGS__)
#define NKVM_LOGE(arg, ...)                                                    \
  NKVM_LOG_IMPL(::nkvm::LogLevel::Error, arg, ##__VA_ARGS__)

#define NKVM_LOG_IMPL(level, arg, ...)                                         \
  do {                                                                         \
    if (::nkvm::log_enabled(level)) {                                          \
      ::nkvm::log_message((level), (arg), ##__VA_ARGS__);                      \
    }                                                                          \
  } while (0)

/**
 * Set the minimum level of messages that will be written to stderr.
 *
 * The default threshold is LogLevel::Warning.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Map a command line verbosity count to a log level.
 *
 * 0 shows warnings and errors, 1 adds info, 2 adds debug and 3 or more shows
 * everything.
 */
LogLevel log_level_for_verbosity(int verbosity);

bool log_enabled(LogLevel level);

__attribute__((__format__ (__printf__, 2, 3)))
void log_message(LogLevel level, const char* fmt, ...);

} // namespace nkvm
