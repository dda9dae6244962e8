// Logger.h
// Minimal leveled logger. Lines go to a pluggable sink; the Application
// routes them to the Arduino Serial port, host builds default to stderr.

#pragma once

#include <stdarg.h>

enum LogLevel {
  LOG_LEVEL_ERROR = 0,
  LOG_LEVEL_WARN = 1,
  LOG_LEVEL_INFO = 2,
  LOG_LEVEL_DEBUG = 3,
};

class Logger {
 public:
  // Receives one formatted line (without trailing newline) per call.
  // C-style callback to avoid libstdc++ bloat from std::function
  using Sink = void (*)(const char* line, void* ctx);

  static void setLevel(LogLevel level) { currentLevel_ = level; }
  static LogLevel level() { return currentLevel_; }

  // Replace the output sink. Passing nullptr restores the stderr sink.
  static void setSink(Sink sink, void* ctx);

  static void error(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_ERROR) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("E", fmt, args);
    va_end(args);
  }

  static void warn(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_WARN) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("W", fmt, args);
    va_end(args);
  }

  static void info(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_INFO) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("I", fmt, args);
    va_end(args);
  }

  static void debug(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_DEBUG) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("D", fmt, args);
    va_end(args);
  }

 private:
  static void printFormatted(const char* level, const char* fmt, va_list args);

  static LogLevel currentLevel_;
};
