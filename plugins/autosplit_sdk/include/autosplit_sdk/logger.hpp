#pragma once

#include "autosplit/autosplit_api.hpp"
#include <string>

namespace autosplit_sdk {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_to_string(LogLevel level);

// Logger - Routes plugin log lines to the host's message primitive
// Lines below the threshold are dropped. Without host bindings the lines
// go to stderr instead.
class Logger {
public:
    Logger() = default;
    explicit Logger(const AutosplitHostApi* host) : m_host(host) {}

    void set_host(const AutosplitHostApi* host) { m_host = host; }

    LogLevel get_level() const { return m_level; }
    void set_level(LogLevel level) { m_level = level; }
    bool enabled(LogLevel level) const { return level >= m_level; }

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const { log(LogLevel::Debug, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void warn(const std::string& message) const { log(LogLevel::Warn, message); }
    void error(const std::string& message) const { log(LogLevel::Error, message); }

    // The text actually handed to the host for a message at `level`
    static std::string format(LogLevel level, const std::string& message);

private:
    const AutosplitHostApi* m_host = nullptr;
    LogLevel m_level = LogLevel::Info;
};

} // namespace autosplit_sdk
