#include "defs.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace VinFastCloud {

namespace {
// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<LogCallback> g_log_callback{nullptr};
std::atomic<int> g_log_level{static_cast<int>(LogLevel::VERBOSE)};
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
}  // namespace

void set_log_callback(LogCallback callback) { g_log_callback.store(callback); }

LogCallback get_log_callback() { return g_log_callback.load(); }

void set_log_level(LogLevel level) { g_log_level.store(static_cast<int>(level)); }

LogLevel get_log_level() { return static_cast<LogLevel>(g_log_level.load()); }

const char *log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::VERBOSE:
      return "VERBOSE";
    default:
      return "UNKNOWN";
  }
}

void log_internal(LogLevel level, const char *tag, int line, const char *format, ...) {
  if (format == nullptr || static_cast<int>(level) > g_log_level.load()) {
    return;
  }
  if (tag == nullptr) {
    tag = "VinFastCloud";
  }

  va_list args;
  va_start(args, format);
  LogCallback callback = g_log_callback.load();
  if (callback != nullptr) {
    callback(level, tag, line, format, args);
    va_end(args);
    return;
  }

  // Requests can echo server bodies; long lines are truncated
  char buffer[1024];
  vsnprintf(buffer, sizeof(buffer), format, args);  // NOLINT(clang-analyzer-valist.Uninitialized)
  va_end(args);

  FILE *out = (level == LogLevel::ERROR) ? stderr : stdout;
  fprintf(out, "[%s][%s] %s\n", log_level_name(level), tag, buffer);  // NOLINT(modernize-use-std-print)
  fflush(out);
}

}  // namespace VinFastCloud
