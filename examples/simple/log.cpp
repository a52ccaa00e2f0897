#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <defs.h>
#include <telemetry_decoder.h>

static void stderr_log_callback(VinFastCloud::LogLevel level, const char *tag, int line, const char *format,
                                va_list args)
{
  fprintf(stderr, "%c (%s:%d) ", VinFastCloud::log_level_name(level)[0], tag, line);
  vfprintf(stderr, format, args);
  fprintf(stderr, "\n");
}

// VINFAST_LOG_VERBOSE=1 turns on DEBUG and VERBOSE lines
static void setup_logging()
{
  VinFastCloud::set_log_callback(stderr_log_callback);
  VinFastCloud::set_log_level(getenv("VINFAST_LOG_VERBOSE") != nullptr ? VinFastCloud::LogLevel::VERBOSE
                                                                        : VinFastCloud::LogLevel::INFO);
}

static void log_telemetry(const VinFastCloud::TelemetrySnapshot &snapshot)
{
  printf("Telemetry (%zu values):\n", snapshot.size());
  for (const auto &entry : snapshot)
  {
    if (entry.second.is_numeric)
    {
      printf("  %-32s %g\n", entry.first.c_str(), entry.second.number);
    }
    else
    {
      printf("  %-32s \"%s\"\n", entry.first.c_str(), entry.second.text.c_str());
    }
  }
}
