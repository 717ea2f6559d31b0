#pragma once

#include <mutex>
#include <string>

namespace cw {

enum class LogLevel { Debug, Info, Warn, Error };

const char* level_name(LogLevel lvl);

// Messages below the threshold are dropped. Default: Warn.
void set_log_level(LogLevel lvl);
LogLevel log_level();

// One line to stderr: "[2026-01-01T00:00:00Z] WARN: msg". Serialized across threads.
void log(LogLevel lvl, const std::string& msg);

inline void log_debug(const std::string& msg) { log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log(LogLevel::Error, msg); }

// Held by log() and by any other writer that can run next to the workers
// (progress line, NDJSON stream).
std::mutex& print_mutex();

} // namespace cw
