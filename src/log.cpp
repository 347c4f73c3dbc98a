#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace pdfmask {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mu;

const char *level_str(LogLevel l) {
    switch (l) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO ";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}
} // namespace

void set_log_level(LogLevel level) { g_level = static_cast<int>(level); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool set_log_level(const std::string &name) {
    if (name == "debug") set_log_level(LogLevel::Debug);
    else if (name == "info") set_log_level(LogLevel::Info);
    else if (name == "warn") set_log_level(LogLevel::Warn);
    else if (name == "error") set_log_level(LogLevel::Error);
    else return false;
    return true;
}

void log_event(LogLevel level, const char *stage, const std::string &message) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[pdfmask] " << level_str(level) << " stage=" << stage << ' ' << message << std::endl;
}

} // namespace pdfmask
