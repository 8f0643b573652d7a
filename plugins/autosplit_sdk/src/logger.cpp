#include "autosplit_sdk/logger.hpp"
#include <iostream>

namespace autosplit_sdk {

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warn:    return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

std::string Logger::format(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::Warn:    return "[WARN] " + message;
        case LogLevel::Error:   return "[ERROR] " + message;
        case LogLevel::Debug:   return "[DEBUG] " + message;
        default:                return message;
    }
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (!enabled(level)) return;

    std::string line = format(level, message);
    if (m_host && m_host->runtime_print_message) {
        m_host->runtime_print_message(m_host->context, line.data(),
                                      static_cast<uint32_t>(line.size()));
    } else {
        std::cerr << "[Autosplitter] " << line << std::endl;
    }
}

} // namespace autosplit_sdk
