// common/utils/logging.cpp
#include "common/utils/logging.h"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace researchflow {

namespace {

LogLevel initial_level() {
    if (const char* env = std::getenv("RESEARCHFLOW_LOG_LEVEL")) {
        if (auto level = parse_log_level(env)) return *level;
    }
    return LogLevel::INFO;
}

std::atomic<LogLevel>& level_ref() {
    static std::atomic<LogLevel> level{initial_level()};
    return level;
}

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO: return "[INFO]";
        case LogLevel::WARNING: return "[WARNING]";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[INFO]";
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warning" || text == "warn") return LogLevel::WARNING;
    if (text == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    level_ref().store(level);
}

LogLevel get_log_level() {
    return level_ref().load();
}

void log_message(LogLevel level, std::string_view component, const std::string& message) {
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(get_log_level())) return;
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << level_tag(level) << " [" << component << "] " << message << std::endl;
}

} // namespace researchflow
