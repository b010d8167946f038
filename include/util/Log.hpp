#pragma once

namespace sift::util {

enum class LogLevel : int { Quiet = 0, Error = 1, Debug = 2 };

// Current level. Initialised once from SIFT_LOG (0, 1 or 2), default Quiet.
[[nodiscard]] LogLevel log_level();
void set_log_level(LogLevel level);

[[nodiscard]] inline bool log_enabled(LogLevel level) {
  return static_cast<int>(log_level()) >= static_cast<int>(level);
}

// Writes "sift: <component>: <message>\n" to stderr when the level is enabled.
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace sift::util
