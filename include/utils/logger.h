#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace quantbox {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    uint64_t timestamp;
};

// Process-wide logger. Console output goes to stderr because stdout carries
// execution results; the optional file sink rotates by size.
class Logger {
public:
    static void init(const std::string& path, uint64_t maxFileBytes = 10 * 1024 * 1024, uint32_t maxFiles = 5);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static LogLevel levelFromString(const std::string& name, LogLevel def = LogLevel::INFO);
    static const char* levelName(LogLevel level);

    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setAllowSensitiveLogging(bool allow);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();

    // Oldest first.
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    // Masks the value of NAME=value / NAME: value pairs whose name looks like a credential.
    static std::string sanitize(const std::string& msg);
    static std::string redactSensitive(const std::string& data, const std::string& type = "secret");
};

#define LOG_DEBUG(msg) do { if (quantbox::utils::Logger::getLevel() <= quantbox::utils::LogLevel::DEBUG) quantbox::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) quantbox::utils::Logger::info(msg)
#define LOG_WARN(msg) quantbox::utils::Logger::warn(msg)
#define LOG_ERROR(msg) quantbox::utils::Logger::error(msg)

}
}
