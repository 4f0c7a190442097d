#include "earshot/core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace earshot {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_out_mutex;

void setLogLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(g_level.load()); }

LogLevel parseLogLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    if (n == "debug") return LogLevel::Debug;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "off" || n == "none") return LogLevel::Off;
    return LogLevel::Info;
}

static bool enabled(LogLevel level) { return static_cast<int>(level) >= g_level.load(); }

void logDebug(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << "[" << tag << "] [DEBUG] " << msg << std::endl;
}

void logInfo(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << "[" << tag << "] " << msg << std::endl;
}

void logWarn(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Warn)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << "[" << tag << "] [WARN] " << msg << std::endl;
}

void logError(const std::string& tag, const std::string& msg) {
    if (!enabled(LogLevel::Error)) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cerr << "[" << tag << "] [ERROR] " << msg << std::endl;
}

}
