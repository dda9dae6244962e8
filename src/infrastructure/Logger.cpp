// Logger.cpp

#include "Logger.h"

#include <stdio.h>

#include <mutex>

namespace {

void stderrSink(const char* line, void* /*ctx*/) {
  fputs(line, stderr);
  fputc('\n', stderr);
}

std::mutex& sinkMutex() {
  static std::mutex m;
  return m;
}

Logger::Sink sink_ = &stderrSink;
void* sinkCtx_ = nullptr;

}  // namespace

LogLevel Logger::currentLevel_ = LOG_LEVEL_INFO;

void Logger::setSink(Sink sink, void* ctx) {
  std::lock_guard<std::mutex> lock(sinkMutex());
  if (sink) {
    sink_ = sink;
    sinkCtx_ = ctx;
  } else {
    sink_ = &stderrSink;
    sinkCtx_ = nullptr;
  }
}

void Logger::printFormatted(const char* level, const char* fmt, va_list args) {
  char buffer[256];
  int prefix = snprintf(buffer, sizeof(buffer), "[%s] ", level);
  if (prefix < 0) return;
  vsnprintf(buffer + prefix, sizeof(buffer) - (size_t)prefix, fmt, args);

  // Worker threads and the BLE host task log concurrently
  std::lock_guard<std::mutex> lock(sinkMutex());
  sink_(buffer, sinkCtx_);
}
