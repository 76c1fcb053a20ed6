#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace chuck {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("CHUCK_LOG");
    if (!env) return LogLevel::Warn;
    return Logger::parseLevel(env, LogLevel::Warn);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

LogLevel Logger::parseLevel(const std::string& v, LogLevel fallback) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return fallback;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::write(LogLevel level, const char* tag, const std::string& msg) const {
    if (currentLevel < level) return;
    std::cerr << tag << ' ' << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error]", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ]", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ]", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug]", msg); }

}

