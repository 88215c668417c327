// Copyright (c) 2023, Adam Simpkins
#include "nkvm/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace nkvm {

namespace {
std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warning)};

char level_char(LogLevel level) {
  switch (level) {
  case LogLevel::Verbose:
    return 'V';
  case LogLevel::Debug:
    return 'D';
  case LogLevel::Info:
    return 'I';
  case LogLevel::Warning:
    return 'W';
  case LogLevel::Error:
    return 'E';
  }
  return '?';
}
} // namespace

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

LogLevel log_level_for_verbosity(int verbosity) {
  if (verbosity <= 0) {
    return LogLevel::Warning;
  } else if (verbosity == 1) {
    return LogLevel::Info;
  } else if (verbosity == 2) {
    return LogLevel::Debug;
  }
  return LogLevel::Verbose;
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >=
         g_log_level.load(std::memory_order_relaxed);
}

void log_message(LogLevel level, const char *fmt, ...) {
  char buf[512];
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  fprintf(stderr, "%c nkvm: %s\n", level_char(level), buf);
}

} // namespace nkvm
