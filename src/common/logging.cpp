// common/logging.cpp
#include "common/logging.h"
#include <atomic>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace agentteam {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::INFO};

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARNING: return "[WARNING] ";
        case LogLevel::ERROR: return "[ERROR] ";
    }
    return "[INFO] ";
}

} // namespace

LogLevel parse_log_level(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

void log_message(LogLevel level, const std::string& message) {
    if (level < g_log_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    out << level_tag(level) << message << std::endl;
}

} // namespace agentteam
