#include "core/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_log_mutex;

void write_line(std::ostream& os, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << "[" << tag << "] " << msg << std::endl;
}
} // anonymous namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel get_log_level() { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel level) { return static_cast<int>(level) <= g_level.load(); }

void log_error(const std::string& msg) { write_line(std::cerr, "ERROR", msg); }
void log_warn(const std::string& msg) {
    if (log_enabled(LogLevel::Warn)) write_line(std::cerr, "WARN", msg);
}
void log_info(const std::string& msg) {
    if (log_enabled(LogLevel::Info)) write_line(std::cout, "INFO", msg);
}
void log_debug(const std::string& msg) {
    if (log_enabled(LogLevel::Debug)) write_line(std::cout, "DEBUG", msg);
}
}
