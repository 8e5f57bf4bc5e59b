#pragma once
#include <string>
#include <functional>

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Messages above the current level are dropped. Default is Info.
void log_set_level(LogLevel level);
LogLevel log_level();
bool parse_log_level(const std::string& s, LogLevel& out);

// A sink replaces stderr output; pass an empty function to restore it.
void log_set_sink(LogSink sink);
// Mirrors every emitted line into the file (appending). Empty path disables it.
void log_set_file(const std::string& path);

void log_write(LogLevel level, const std::string& msg);

inline void log_error(const std::string& msg) { log_write(LogLevel::Error, msg); }
inline void log_warn(const std::string& msg) { log_write(LogLevel::Warn, msg); }
inline void log_info(const std::string& msg) { log_write(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) { log_write(LogLevel::Debug, msg); }
