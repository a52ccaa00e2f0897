#pragma once

#include <cstdarg>

namespace VinFastCloud {

enum class LogLevel { ERROR, WARN, INFO, DEBUG, VERBOSE };

// Receives every log line when installed; the va_list is only valid for the duration of the call.
using LogCallback = void (*)(LogLevel level, const char *tag, int line, const char *format, va_list args);

void set_log_callback(LogCallback callback);
LogCallback get_log_callback();

// Lines less severe than this are dropped before reaching the callback or the console.
// Defaults to VERBOSE (everything).
void set_log_level(LogLevel level);
LogLevel get_log_level();

// "ERROR", "WARN", "INFO", "DEBUG", "VERBOSE"
const char *log_level_name(LogLevel level);

void log_internal(LogLevel level, const char *tag, int line, const char *format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

}  // namespace VinFastCloud

#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud"
#endif

#define LOG_ERROR(...) ::VinFastCloud::log_internal(::VinFastCloud::LogLevel::ERROR, VINFAST_LOG_TAG, __LINE__, __VA_ARGS__)
#define LOG_WARNING(...) ::VinFastCloud::log_internal(::VinFastCloud::LogLevel::WARN, VINFAST_LOG_TAG, __LINE__, __VA_ARGS__)
#define LOG_INFO(...) ::VinFastCloud::log_internal(::VinFastCloud::LogLevel::INFO, VINFAST_LOG_TAG, __LINE__, __VA_ARGS__)
#define LOG_DEBUG(...) ::VinFastCloud::log_internal(::VinFastCloud::LogLevel::DEBUG, VINFAST_LOG_TAG, __LINE__, __VA_ARGS__)
#define LOG_VERBOSE(...) \
  ::VinFastCloud::log_internal(::VinFastCloud::LogLevel::VERBOSE, VINFAST_LOG_TAG, __LINE__, __VA_ARGS__)
