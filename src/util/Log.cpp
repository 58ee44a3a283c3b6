#include "util/Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <string>

namespace gadgetimg::util {

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warning";
    case LogLevel::Error: return "error";
  }
  return "?";
}

LogSink stderr_sink() {
  return [](LogLevel level, std::string_view msg) {
    if (level == LogLevel::Warn || level == LogLevel::Error) {
      std::fprintf(stderr, "gadgetimg: %s: %.*s\n", to_string(level),
                   static_cast<int>(msg.size()), msg.data());
    } else {
      std::fprintf(stderr, "gadgetimg: %.*s\n", static_cast<int>(msg.size()), msg.data());
    }
  };
}

Logger::Logger() : sink_(stderr_sink()) {}

Logger::Logger(LogSink sink, bool debug) : sink_(std::move(sink)), debug_(debug) {
  if (!sink_) sink_ = stderr_sink();
}

void Logger::emit(LogLevel level, const char* fmt, va_list ap) {
  va_list copy;
  va_copy(copy, ap);
  int n = std::vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);
  if (n < 0) return;
  std::string line(static_cast<size_t>(n), '\0');
  std::vsnprintf(line.data(), line.size() + 1, fmt, ap);
  sink_(level, line);
}

void Logger::debug(const char* fmt, ...) {
  if (!debug_) return;
  va_list ap;
  va_start(ap, fmt);
  emit(LogLevel::Debug, fmt, ap);
  va_end(ap);
}

void Logger::info(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LogLevel::Info, fmt, ap);
  va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LogLevel::Warn, fmt, ap);
  va_end(ap);
}

void Logger::error(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  emit(LogLevel::Error, fmt, ap);
  va_end(ap);
}

} // namespace gadgetimg::util
