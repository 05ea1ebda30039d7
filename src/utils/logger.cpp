#include "utils/logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace quantbox {
namespace utils {

namespace {

constexpr size_t MAX_RECENT_ENTRIES = 500;

struct LogState {
    std::mutex mtx;
    std::atomic<LogLevel> level{LogLevel::INFO};
    std::atomic<bool> console{true};
    std::atomic<bool> fileSink{true};
    std::atomic<bool> allowSensitive{false};

    // Guarded by mtx.
    std::ofstream file;
    std::string path;
    uint64_t maxFileBytes = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
    bool initialized = false;
    std::deque<LogEntry> recent;
};

LogState& state() {
    static LogState s;
    return s;
}

// Name fragments that mark a credential-bearing key, matched case-insensitively.
const char* const SENSITIVE_NAMES[] = {"api_key", "secret", "access_key", "token", "password"};

bool isValueDelimiter(char c) {
    return c == '"' || c == '\'' || c == ' ' || c == ',' || c == ';' || c == ')' || c == '\n';
}

// Shifts path.N to path.N+1, dropping the oldest, then reopens an empty file.
void rotateLocked(LogState& s) {
    if (s.path.empty()) return;
    if (s.file.is_open()) s.file.close();

    std::error_code ec;
    if (s.maxFiles > 0) {
        std::filesystem::remove(s.path + "." + std::to_string(s.maxFiles), ec);
    }
    for (uint32_t i = s.maxFiles; i > 1; i--) {
        std::string from = s.path + "." + std::to_string(i - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, s.path + "." + std::to_string(i), ec);
        }
    }
    if (s.maxFiles == 0) {
        s.file.open(s.path, std::ios::trunc);
        return;
    }
    if (std::filesystem::exists(s.path, ec)) {
        std::filesystem::rename(s.path, s.path + ".1", ec);
    }
    s.file.open(s.path, std::ios::app);
}

std::string timestampText(time_t now) {
    char buf[32];
    struct tm local;
    localtime_r(&now, &local);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

void write(LogLevel level, const std::string& category, const std::string& msg) {
    LogState& s = state();
    LogLevel threshold = s.level.load();
    if (threshold == LogLevel::OFF || level < threshold) return;

    std::string text = s.allowSensitive ? msg : Logger::sanitize(msg);
    time_t now = std::time(nullptr);

    std::ostringstream line;
    line << timestampText(now) << " [" << Logger::levelName(level) << "]";
    if (!category.empty()) line << " [" << category << "]";
    line << " " << text << "\n";

    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console) std::cerr << line.str();

    if (s.fileSink && s.file.is_open()) {
        s.file << line.str();
        s.file.flush();
        if (static_cast<uint64_t>(s.file.tellp()) > s.maxFileBytes) rotateLocked(s);
    }

    s.recent.push_back(LogEntry{level, category, text, static_cast<uint64_t>(now)});
    if (s.recent.size() > MAX_RECENT_ENTRIES) s.recent.pop_front();
}

}

void Logger::init(const std::string& path, uint64_t maxFileBytes, uint32_t maxFiles) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);

    std::error_code ec;
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    if (s.file.is_open()) s.file.close();
    s.path = path;
    s.maxFileBytes = maxFileBytes > 0 ? maxFileBytes : 10 * 1024 * 1024;
    s.maxFiles = maxFiles;
    s.file.open(path, std::ios::app);
    s.fileSink = true;
    s.initialized = s.file.is_open();

    const char* env = std::getenv("QUANTBOX_ALLOW_SENSITIVE_LOGS");
    if (env && (std::string(env) == "1" || std::string(env) == "true")) s.allowSensitive = true;
}

void Logger::shutdown() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
    s.initialized = false;
}

bool Logger::isInitialized() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.initialized;
}

void Logger::setLevel(LogLevel level) {
    state().level = level;
}

LogLevel Logger::getLevel() {
    return state().level;
}

LogLevel Logger::levelFromString(const std::string& name, LogLevel def) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return def;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF: return "OFF";
    }
    return "?";
}

void Logger::enableConsole(bool enable) {
    state().console = enable;
}

void Logger::enableFile(bool enable) {
    state().fileSink = enable;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    state().allowSensitive = allow;
}

void Logger::debug(const std::string& msg) { write(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { write(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { write(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { write(LogLevel::ERROR, "", msg); }

void Logger::log(LogLevel level, const std::string& msg) {
    write(level, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    write(level, category, msg);
}

void Logger::flush() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.flush();
    std::cerr.flush();
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t start = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(start), s.recent.end());
}

void Logger::clearLogs() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
}

std::string Logger::sanitize(const std::string& msg) {
    std::string lower = msg;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    std::string out = msg;
    // Walk from the back so earlier offsets stay valid while values are replaced.
    std::vector<std::pair<size_t, size_t>> spans;
    for (const char* name : SENSITIVE_NAMES) {
        std::string key(name);
        for (size_t pos = lower.find(key); pos != std::string::npos; pos = lower.find(key, pos + key.size())) {
            size_t i = pos + key.size();
            while (i < lower.size() && std::isalnum(static_cast<unsigned char>(lower[i]))) i++;
            size_t sep = i;
            while (i < lower.size() && (lower[i] == ' ' || lower[i] == '"' || lower[i] == '\'' ||
                                        lower[i] == ':' || lower[i] == '=')) i++;
            if (i == sep || lower.find_first_of(":=", sep) >= i) continue;
            size_t end = i;
            while (end < lower.size() && !isValueDelimiter(lower[end])) end++;
            if (end > i) spans.emplace_back(i, end);
        }
    }
    std::sort(spans.begin(), spans.end());
    spans.erase(std::unique(spans.begin(), spans.end()), spans.end());
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        out.replace(it->first, it->second - it->first, "[REDACTED]");
    }
    return out;
}

std::string Logger::redactSensitive(const std::string& data, const std::string& type) {
    if (state().allowSensitive) return data;
    return "[REDACTED_" + type + "]";
}

}
}
