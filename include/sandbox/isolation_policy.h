#pragma once

#include <string>
#include <set>
#include <vector>
#include <cstdint>

namespace quantbox {
namespace sandbox {

enum class IsolationLevel {
    DEVELOPMENT,
    PRODUCTION,
    HARDENED
};

const char* levelToString(IsolationLevel level);
// Throws PolicyError for names other than development/production/hardened.
IsolationLevel levelFromString(const std::string& name);

const std::set<std::string>& defaultAllowedImports();
const std::set<std::string>& minimalAllowedImports();

constexpr uint32_t MIN_EXECUTION_TIME_SEC = 1;
constexpr uint32_t MAX_EXECUTION_TIME_SEC = 300;
constexpr uint32_t MIN_MEMORY_MB = 32;
constexpr uint32_t MAX_MEMORY_MB = 2048;

struct IsolationPolicy {
    IsolationLevel level = IsolationLevel::PRODUCTION;
    std::set<std::string> allowedImports;
    uint32_t maxExecutionTimeSec = 30;
    uint32_t maxMemoryMb = 256;
    bool allowNetwork = false;
    std::vector<std::string> allowedDomains;
    bool allowFileRead = false;
    bool allowFileWrite = false;
    std::vector<std::string> allowedReadPaths;

    IsolationPolicy();
    explicit IsolationPolicy(IsolationLevel tier);

    // Overwrites every tier-controlled field; applying the same tier twice is a no-op.
    IsolationPolicy& applyLevel(IsolationLevel tier);
    void validate() const;
    bool isModuleAllowed(const std::string& name) const;

    std::string describe() const;
};

}
}
