#ifndef EARSHOT_LOGGING_HPP
#define EARSHOT_LOGGING_HPP

#include <string>

namespace earshot {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Parses "debug", "info", "warn", "error" or "off". Unknown names map to Info.
LogLevel parseLogLevel(const std::string& name);

// Lines come out as "[Tag] message" or "[Tag] [WARN] message"
void logDebug(const std::string& tag, const std::string& msg);
void logInfo(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

}

#endif
