#include "sandbox/isolation_policy.h"
#include "infrastructure/error_handling.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace quantbox {
namespace sandbox {

const char* levelToString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::DEVELOPMENT: return "development";
        case IsolationLevel::PRODUCTION: return "production";
        case IsolationLevel::HARDENED: return "hardened";
    }
    return "unknown";
}

IsolationLevel levelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "development") return IsolationLevel::DEVELOPMENT;
    if (lower == "production") return IsolationLevel::PRODUCTION;
    if (lower == "hardened") return IsolationLevel::HARDENED;
    throw PolicyError("Unknown isolation level '" + name + "' (expected development, production or hardened)");
}

const std::set<std::string>& defaultAllowedImports() {
    static const std::set<std::string> modules = {
        "collections", "datetime", "decimal", "fractions", "functools",
        "itertools", "json", "math", "operator", "quantbox_safe",
        "random", "re", "statistics", "string", "time"
    };
    return modules;
}

const std::set<std::string>& minimalAllowedImports() {
    static const std::set<std::string> modules = {"json", "math", "quantbox_safe", "statistics"};
    return modules;
}

IsolationPolicy::IsolationPolicy() {
    applyLevel(IsolationLevel::PRODUCTION);
}

IsolationPolicy::IsolationPolicy(IsolationLevel tier) {
    applyLevel(tier);
}

IsolationPolicy& IsolationPolicy::applyLevel(IsolationLevel tier) {
    level = tier;
    allowFileWrite = false;
    allowedReadPaths.clear();

    switch (tier) {
        case IsolationLevel::DEVELOPMENT:
            maxExecutionTimeSec = 60;
            maxMemoryMb = 512;
            allowNetwork = true;
            allowedDomains = {"localhost:8000"};
            allowFileRead = true;
            allowedImports = defaultAllowedImports();
            break;
        case IsolationLevel::PRODUCTION:
            maxExecutionTimeSec = 30;
            maxMemoryMb = 256;
            allowNetwork = false;
            allowedDomains.clear();
            allowFileRead = false;
            allowedImports = defaultAllowedImports();
            break;
        case IsolationLevel::HARDENED:
            maxExecutionTimeSec = 10;
            maxMemoryMb = 128;
            allowNetwork = false;
            allowedDomains.clear();
            allowFileRead = false;
            allowedImports = minimalAllowedImports();
            break;
    }
    return *this;
}

void IsolationPolicy::validate() const {
    if (maxExecutionTimeSec < MIN_EXECUTION_TIME_SEC || maxExecutionTimeSec > MAX_EXECUTION_TIME_SEC) {
        throw PolicyError("maxExecutionTimeSec must be between " + std::to_string(MIN_EXECUTION_TIME_SEC) +
                          " and " + std::to_string(MAX_EXECUTION_TIME_SEC) + ", got " +
                          std::to_string(maxExecutionTimeSec));
    }
    if (maxMemoryMb < MIN_MEMORY_MB || maxMemoryMb > MAX_MEMORY_MB) {
        throw PolicyError("maxMemoryMb must be between " + std::to_string(MIN_MEMORY_MB) +
                          " and " + std::to_string(MAX_MEMORY_MB) + ", got " +
                          std::to_string(maxMemoryMb));
    }
    if (allowNetwork && allowedDomains.empty()) {
        throw PolicyError("allowNetwork requires at least one entry in allowedDomains");
    }
}

bool IsolationPolicy::isModuleAllowed(const std::string& name) const {
    if (name.empty() || name[0] == '.') return false;
    std::string top = name.substr(0, name.find('.'));
    return allowedImports.count(top) > 0;
}

std::string IsolationPolicy::describe() const {
    std::ostringstream oss;
    oss << levelToString(level) << " (time=" << maxExecutionTimeSec << "s, memory="
        << maxMemoryMb << "MB, network=" << (allowNetwork ? "on" : "off")
        << ", read=" << (allowFileRead ? "on" : "off")
        << ", write=" << (allowFileWrite ? "on" : "off")
        << ", modules=" << allowedImports.size() << ")";
    return oss.str();
}

}
}
