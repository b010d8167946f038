#include "util/Log.hpp"
#include "util/Env.hpp"
#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace sift::util {

static int initial_level() {
  const char* v = getenv_compat("SIFT_LOG");
  if (!v) return static_cast<int>(LogLevel::Quiet);
  if (v[0] >= '2' && v[0] <= '9') return static_cast<int>(LogLevel::Debug);
  if (v[0] == '1') return static_cast<int>(LogLevel::Error);
  return static_cast<int>(LogLevel::Quiet);
}

static std::atomic<int>& level_ref() {
  static std::atomic<int> level{initial_level()};
  return level;
}

LogLevel log_level() { return static_cast<LogLevel>(level_ref().load(std::memory_order_relaxed)); }

void set_log_level(LogLevel level) { level_ref().store(static_cast<int>(level), std::memory_order_relaxed); }

static void vlog(const char* component, const char* fmt, va_list ap) {
  // One fprintf per line
  char msg[512];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  std::fprintf(stderr, "sift: %s: %s\n", component, msg);
}

void log_error(const char* component, const char* fmt, ...) {
  if (!log_enabled(LogLevel::Error)) return;
  va_list ap;
  va_start(ap, fmt);
  vlog(component, fmt, ap);
  va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  if (!log_enabled(LogLevel::Debug)) return;
  va_list ap;
  va_start(ap, fmt);
  vlog(component, fmt, ap);
  va_end(ap);
}

} // namespace sift::util
