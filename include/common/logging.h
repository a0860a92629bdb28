#ifndef AGENTTEAM_COMMON_LOGGING_H
#define AGENTTEAM_COMMON_LOGGING_H

#include <string>
#include <cstdint>

namespace agentteam {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// "debug" / "info" / "warning" / "error" (case-insensitive); unknown -> INFO
LogLevel parse_log_level(const std::string& level);

void set_log_level(LogLevel level);
LogLevel get_log_level();

// 写一行 "[LEVEL] message"。DEBUG/INFO -> std::cout, WARNING/ERROR -> std::cerr.
// Lines are serialized, so pool threads never interleave output.
void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_message(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::INFO, message); }
inline void log_warning(const std::string& message) { log_message(LogLevel::WARNING, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::ERROR, message); }

} // namespace agentteam

#endif // AGENTTEAM_COMMON_LOGGING_H
