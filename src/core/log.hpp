#pragma once

#include <string>

// Append-only debug log shared by every component.
// Default location is <temp>/termbridge_debug.log; Config can move it.

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

void set_log_path(const std::string& path);
std::string log_path();

// Write one timestamped line. Never throws; a log that cannot be opened is skipped.
void engine_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { engine_log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg)  { engine_log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg)  { engine_log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) { engine_log(LogLevel::ERROR, msg); }
