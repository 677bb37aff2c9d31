#pragma once
#include <cstdint>

#include "Params.h"

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Tagged printf-style logging to stderr:

    [     12345] WARN  Link: Client inactive for 30000 ms, dropping

  Safe to call from the server loop and the safety monitor thread at the
  same time (one line is written under a lock).

  LOG_DEBUG compiles to nothing unless ENABLE_DEBUG_LOG is set in Params.h.
===============================================================================
*/

enum class LogLevel : uint8_t {
  DBG = 0,
  INFO,
  WARN,
  ERR,
};

void logPrintf(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

#define LOG_DEBUG(tag, ...)                                   \
  do {                                                        \
    if (ENABLE_DEBUG_LOG) logPrintf(LogLevel::DBG, tag, __VA_ARGS__); \
  } while (0)

#define LOG_INFO(tag, ...)  logPrintf(LogLevel::INFO, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...)  logPrintf(LogLevel::WARN, tag, __VA_ARGS__)
#define LOG_ERROR(tag, ...) logPrintf(LogLevel::ERR, tag, __VA_ARGS__)
