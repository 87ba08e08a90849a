#include "log.hpp"
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <sys/time.h>

static FILE* log_file() {
  static FILE* f = []() -> FILE* {
    const char* path = std::getenv("MLINE_LOG");
    if (!path || !*path) return nullptr;
    return std::fopen(path, "a");
  }();
  return f;
}

bool ml_log_enabled() { return log_file() != nullptr; }

void ml_log_write(const char* file, int line, const char* fmt, ...) {
  FILE* f = log_file();
  if (!f) return;
  struct timeval tv{};
  ::gettimeofday(&tv, nullptr);
  struct tm tm{};
  ::localtime_r(&tv.tv_sec, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);
  const char* base = std::strrchr(file, '/');
  std::fprintf(f, "%s.%03ld %s:%d ", stamp, static_cast<long>(tv.tv_usec / 1000), base ? base + 1 : file, line);
  va_list args;
  va_start(args, fmt);
  std::vfprintf(f, fmt, args);
  va_end(args);
  std::fputc('\n', f);
  std::fflush(f);
}
