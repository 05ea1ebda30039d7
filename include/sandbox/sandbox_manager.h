#pragma once

#include "sandbox/isolation_policy.h"
#include "infrastructure/error_handling.h"
#include "engine/value.h"
#include "utils/config.h"
#include <string>
#include <optional>
#include <future>
#include <memory>
#include <cstdint>

namespace quantbox {
namespace sandbox {

// Execution-time configuration. The policy is validated on construction and
// cannot be changed afterwards.
class SandboxConfig {
public:
    explicit SandboxConfig(IsolationPolicy policy);
    SandboxConfig(IsolationPolicy policy, utils::SandboxSettings runtime);

    const IsolationPolicy& policy() const { return policy_; }
    const utils::SandboxSettings& runtime() const { return runtime_; }
    uint32_t maxExecutionTimeSec() const { return policy_.maxExecutionTimeSec; }
    uint32_t maxMemoryMb() const { return policy_.maxMemoryMb; }
    // Override when positive, else the policy limit; never above MAX_EXECUTION_TIME_SEC.
    uint32_t effectiveTimeoutSec(uint32_t overrideSec) const;

private:
    IsolationPolicy policy_;
    utils::SandboxSettings runtime_;
};

struct ExecutionResult {
    bool success = false;
    engine::Value output;
    std::string stdoutText;
    std::string stderrText;
    uint64_t executionTimeMs = 0;
    std::optional<std::string> error;
    std::optional<std::string> echoedProgram;
    ErrorCode errorCode = ErrorCode::OK;
    std::optional<int> exitCode;

    engine::Value toJson() const;
};

struct CodeValidation {
    bool valid = true;
    std::string pattern;
    std::string message;
};

class SandboxManager {
public:
    SandboxManager();
    explicit SandboxManager(SandboxConfig config);

    const SandboxConfig& config() const { return *config_; }
    const IsolationPolicy& policy() const { return config_->policy(); }

    // Never throws: every failure is reported through the result.
    ExecutionResult execute(const std::string& script,
                            const engine::Value& context = engine::Value::object(),
                            uint32_t timeoutOverrideSec = 0,
                            bool captureScript = false) const;

    std::future<ExecutionResult> executeAsync(std::string script,
                                              engine::Value context = engine::Value::object(),
                                              uint32_t timeoutOverrideSec = 0,
                                              bool captureScript = false) const;

    // Advisory substring scan; execute() does not call it.
    static CodeValidation validateCode(const std::string& code);

private:
    std::shared_ptr<const SandboxConfig> config_;
};

}
}
