#pragma once
/*
 * Log
 *
 * Purpose: opt-in trace log for key decoding and redraw decisions.
 * Usage: set MLINE_LOG=/path/to/file; ML_LOG("fmt", ...) appends one timestamped line.
 * Note: never writes to the terminal the session is drawing on.
 */
#include <cstdio>

bool ml_log_enabled();
void ml_log_write(const char* file, int line, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

#define ML_LOG(...)                                   \
  do {                                                \
    if (ml_log_enabled()) ml_log_write(__FILE__, __LINE__, __VA_ARGS__); \
  } while (0)
