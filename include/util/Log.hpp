#pragma once
#include <cstdarg>
#include <functional>
#include <string_view>

namespace gadgetimg::util {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] const char* to_string(LogLevel level);

using LogSink = std::function<void(LogLevel, std::string_view)>;

// Writes "gadgetimg: <message>" (warn/error prefixed with the level) to stderr.
[[nodiscard]] LogSink stderr_sink();

// printf-style front end over a replaceable sink. Debug lines are dropped
// unless enabled so tool argv traces stay out of normal runs.
class Logger {
public:
  Logger();
  explicit Logger(LogSink sink, bool debug = false);

  void set_debug(bool on) { debug_ = on; }
  [[nodiscard]] bool debug_enabled() const { return debug_; }

  void debug(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  void info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  void warn(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:
  void emit(LogLevel level, const char* fmt, va_list ap);

  LogSink sink_;
  bool debug_{false};
};

} // namespace gadgetimg::util
