#pragma once
/*
 * Log
 *
 * Purpose: leveled logging to stderr, "[LEVEL] HH:MM:SS message".
 * Note: the minimum level is process-wide; default Info, PEDIT_LOG overrides.
 */
#include <string>
#include <string_view>
#include <optional>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void log_set_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);
/* reads PEDIT_LOG once; leaves the level alone when unset or unparsable */
void log_init_from_env();

void log_write(LogLevel level, std::string_view message);

inline void log_debug(std::string_view m) { log_write(LogLevel::Debug, m); }
inline void log_info(std::string_view m) { log_write(LogLevel::Info, m); }
inline void log_warn(std::string_view m) { log_write(LogLevel::Warn, m); }
inline void log_error(std::string_view m) { log_write(LogLevel::Error, m); }
