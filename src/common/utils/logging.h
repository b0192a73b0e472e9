#ifndef RESEARCHFLOW_COMMON_UTILS_LOGGING_H
#define RESEARCHFLOW_COMMON_UTILS_LOGGING_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace researchflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

std::optional<LogLevel> parse_log_level(std::string_view text);

void set_log_level(LogLevel level);
LogLevel get_log_level();

// 输出一行 "[LEVEL] [component] message" 到 stderr
void log_message(LogLevel level, std::string_view component, const std::string& message);

inline void log_debug(std::string_view component, const std::string& message) {
    log_message(LogLevel::DEBUG, component, message);
}
inline void log_info(std::string_view component, const std::string& message) {
    log_message(LogLevel::INFO, component, message);
}
inline void log_warning(std::string_view component, const std::string& message) {
    log_message(LogLevel::WARNING, component, message);
}
inline void log_error(std::string_view component, const std::string& message) {
    log_message(LogLevel::ERROR, component, message);
}

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_LOGGING_H
