#pragma once
#include <string>

namespace core {

enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug
};

// Process-wide threshold; messages above it are dropped. Default: Warn.
void set_log_level(LogLevel level);
LogLevel get_log_level();
bool log_enabled(LogLevel level);

void log_error(const std::string& msg);
void log_warn(const std::string& msg);
void log_info(const std::string& msg);
void log_debug(const std::string& msg);
}
