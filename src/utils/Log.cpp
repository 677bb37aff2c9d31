#include "utils/Log.h"

#include <stdarg.h>
#include <stdio.h>

#include <mutex>

#include "utils/Clock.h"

namespace {

std::mutex g_log_mutex;

const char* levelName(LogLevel level) {
  switch (level) {
    case LogLevel::DBG:  return "DEBUG";
    case LogLevel::INFO: return "INFO ";
    case LogLevel::WARN: return "WARN ";
    case LogLevel::ERR:  return "ERROR";
  }
  return "?    ";
}

}  // namespace

void logPrintf(LogLevel level, const char* tag, const char* fmt, ...) {
  char msg[256];

  va_list args;
  va_start(args, fmt);
  vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  const uint32_t now_ms = millis();

  std::lock_guard<std::mutex> lock(g_log_mutex);
  fprintf(stderr, "[%10lu] %s %s: %s\n",
          (unsigned long)now_ms,
          levelName(level),
          tag ? tag : "-",
          msg);
  fflush(stderr);
}
