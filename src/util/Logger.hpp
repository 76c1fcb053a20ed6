#pragma once

#include <string>

namespace chuck {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Every line goes to stderr so that stdout only carries command output
 * (plain text or JSON). The initial level comes from CHUCK_LOG.
 */
class Logger {
public:
    static Logger& instance();
    static LogLevel parseLevel(const std::string& text, LogLevel fallback);

    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
};

}

