#include "sandbox/sandbox_manager.h"
#include "sandbox/guarded_program.h"
#include "sandbox/child_process.h"
#include "utils/logger.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <sstream>

namespace quantbox {
namespace sandbox {

static const char* LOG_CATEGORY = "sandbox";

SandboxConfig::SandboxConfig(IsolationPolicy policy)
    : SandboxConfig(std::move(policy), utils::Config::instance().getSandboxSettings()) {}

SandboxConfig::SandboxConfig(IsolationPolicy policy, utils::SandboxSettings runtime)
    : policy_(std::move(policy)), runtime_(std::move(runtime)) {
    policy_.validate();
}

uint32_t SandboxConfig::effectiveTimeoutSec(uint32_t overrideSec) const {
    uint32_t sec = overrideSec > 0 ? overrideSec : policy_.maxExecutionTimeSec;
    return std::min(sec, MAX_EXECUTION_TIME_SEC);
}

engine::Value ExecutionResult::toJson() const {
    engine::Value out = engine::Value::object();
    out["success"] = success;
    out["output"] = output;
    out["stdout"] = stdoutText;
    out["stderr"] = stderrText;
    out["execution_time_ms"] = executionTimeMs;
    out["error"] = error ? engine::Value(*error) : engine::Value(nullptr);
    out["error_type"] = errorCode == ErrorCode::OK ? engine::Value(nullptr) : engine::Value(errorCodeName(errorCode));
    out["exit_code"] = exitCode ? engine::Value(*exitCode) : engine::Value(nullptr);
    out["echoed_program"] = echoedProgram ? engine::Value(*echoedProgram) : engine::Value(nullptr);
    return out;
}

// The structured failure object, taken from the whole stream or its last line.
static std::optional<engine::Value> parseFailureReport(const std::string& text) {
    auto accept = [](const engine::Value& v) {
        return v.is_object() && v.contains("success") && v["success"] == false && v.contains("error");
    };

    engine::Value whole = engine::Value::parse(text, nullptr, false);
    if (!whole.is_discarded() && accept(whole)) return whole;

    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return std::nullopt;
    size_t begin = text.rfind('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    engine::Value last = engine::Value::parse(text.substr(begin, end - begin + 1), nullptr, false);
    if (!last.is_discarded() && accept(last)) return last;
    return std::nullopt;
}

static std::string asText(const engine::Value& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

static void fail(ExecutionResult& result, ErrorCode code, const std::string& message) {
    result.success = false;
    result.errorCode = code;
    result.error = message;
}

static void classify(const ProcessOutcome& outcome, uint32_t timeoutSec, ExecutionResult& result) {
    result.stdoutText = outcome.stdoutText;
    result.stderrText = outcome.stderrText;
    result.executionTimeMs = outcome.elapsedMs;
    if (outcome.exited) result.exitCode = outcome.exitCode;

    if (outcome.timedOut) {
        fail(result, ErrorCode::TIMEOUT, "Execution timed out after " + std::to_string(timeoutSec) + "s");
        return;
    }

    if (outcome.exited && outcome.exitCode == 0) {
        engine::Value parsed = engine::Value::parse(outcome.stdoutText, nullptr, false);
        if (parsed.is_discarded()) {
            std::string msg = "Code did not return JSON-serializable output";
            if (outcome.outputTruncated) msg += " (output truncated)";
            fail(result, ErrorCode::OUTPUT_CONTRACT, msg);
            return;
        }
        result.success = true;
        result.output = std::move(parsed);
        return;
    }

    if (outcome.exited && (outcome.exitCode == EXIT_SCRIPT_FAILED || outcome.exitCode == EXIT_OUTPUT_CONTRACT)) {
        auto report = parseFailureReport(outcome.stdoutText);
        if (report) {
            std::string errorType = report->contains("error_type") ? asText((*report)["error_type"]) : "Error";
            std::string message = errorType + ": " + asText((*report)["error"]);
            ErrorCode code = ErrorCode::SCRIPT_FAILED;
            if (outcome.exitCode == EXIT_OUTPUT_CONTRACT) {
                // Same leading text as an unparseable stdout.
                code = ErrorCode::OUTPUT_CONTRACT;
                message = asText((*report)["error"]);
            } else if (errorType == "ImportDenied") {
                code = ErrorCode::IMPORT_DENIED;
            }
            fail(result, code, message);
            result.output = std::move(*report);
            return;
        }
    }

    if (outcome.exited) {
        fail(result, ErrorCode::EXECUTION_FAILED,
             "Execution failed with exit code " + std::to_string(outcome.exitCode));
        return;
    }

    const char* sigName = strsignal(outcome.termSignal);
    fail(result, ErrorCode::EXECUTION_FAILED,
         "Execution terminated by signal " + std::to_string(outcome.termSignal) +
         (sigName ? std::string(" (") + sigName + ")" : std::string()));
}

static ExecutionResult runExecution(const SandboxConfig& config,
                                    const std::string& script,
                                    const engine::Value& context,
                                    uint32_t timeoutOverrideSec,
                                    bool captureScript) {
    ExecutionResult result;
    const IsolationPolicy& policy = config.policy();
    const utils::SandboxSettings& runtime = config.runtime();
    uint32_t timeoutSec = config.effectiveTimeoutSec(timeoutOverrideSec);
    auto start = std::chrono::steady_clock::now();

    try {
        std::string program = composeGuardedProgram(policy, script, context, runtime.enginePath);
        if (captureScript) result.echoedProgram = program;

        std::string interpreter = resolveInterpreter(runtime.interpreter);
        if (interpreter.empty()) {
            throw QuantboxError(ErrorCode::SETUP_FAILED,
                                "No Python interpreter found" +
                                (runtime.interpreter.empty() ? std::string() : " at '" + runtime.interpreter + "'"));
        }

        ScopedTempFile file(runtime.tempDir, "quantbox_", ".py");
        file.write(program);

        ProcessSpec spec;
        spec.executable = interpreter;
        // -I keeps the temp directory and PYTHON* variables out of module lookup,
        // which also drops PYTHONUNBUFFERED; -u restores unbuffered streams.
        spec.args = {"-I", "-B", "-u", file.path()};
        spec.env = buildRestrictedEnvironment(runtime.envPassthrough);
        spec.limits.timeoutMs = static_cast<uint32_t>(uint64_t{timeoutSec} * 1000);
        spec.limits.cpuSeconds = timeoutSec + 1;
        spec.limits.memoryBytes = static_cast<uint64_t>(policy.maxMemoryMb) * 1024 * 1024;
        spec.limits.allowFileWrite = policy.allowFileWrite;
        spec.maxOutputBytes = runtime.maxOutputBytes;

        utils::Logger::log(utils::LogLevel::DEBUG, LOG_CATEGORY,
                           "Running script under " + policy.describe() + " with timeout " +
                           std::to_string(timeoutSec) + "s");
        ProcessOutcome outcome = runProcess(spec);
        classify(outcome, timeoutSec, result);
    } catch (const QuantboxError& e) {
        fail(result, e.code(), std::string("Execution setup failed: ") + e.what());
    } catch (const std::exception& e) {
        fail(result, ErrorCode::SETUP_FAILED, std::string("Execution setup failed: ") + e.what());
    }

    if (result.executionTimeMs == 0) {
        result.executionTimeMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    }

    if (result.success) {
        utils::Logger::log(utils::LogLevel::DEBUG, LOG_CATEGORY,
                           "Script finished in " + std::to_string(result.executionTimeMs) + "ms");
    } else {
        std::string message = result.error.value_or(errorToString(result.errorCode));
        ErrorHandler::instance().handle(makeError(result.errorCode, message, LOG_CATEGORY));
        utils::Logger::log(result.errorCode == ErrorCode::SETUP_FAILED ? utils::LogLevel::ERROR : utils::LogLevel::WARN,
                           LOG_CATEGORY, std::string(errorCodeName(result.errorCode)) + ": " + message);
    }
    return result;
}

SandboxManager::SandboxManager()
    : config_(std::make_shared<const SandboxConfig>(IsolationPolicy(IsolationLevel::PRODUCTION))) {}

SandboxManager::SandboxManager(SandboxConfig config)
    : config_(std::make_shared<const SandboxConfig>(std::move(config))) {}

ExecutionResult SandboxManager::execute(const std::string& script,
                                        const engine::Value& context,
                                        uint32_t timeoutOverrideSec,
                                        bool captureScript) const {
    return runExecution(*config_, script, context, timeoutOverrideSec, captureScript);
}

std::future<ExecutionResult> SandboxManager::executeAsync(std::string script,
                                                          engine::Value context,
                                                          uint32_t timeoutOverrideSec,
                                                          bool captureScript) const {
    std::shared_ptr<const SandboxConfig> config = config_;
    return std::async(std::launch::async,
                      [config, script = std::move(script), context = std::move(context),
                       timeoutOverrideSec, captureScript]() {
                          return runExecution(*config, script, context, timeoutOverrideSec, captureScript);
                      });
}

CodeValidation SandboxManager::validateCode(const std::string& code) {
    static const char* const patterns[] = {
        "eval(", "exec(", "compile(", "__import__(",
        "os.system", "subprocess", "open(", "pickle"
    };

    CodeValidation v;
    for (const char* pattern : patterns) {
        if (code.find(pattern) != std::string::npos) {
            v.valid = false;
            v.pattern = pattern;
            v.message = std::string("Dangerous pattern detected: ") + pattern;
            break;
        }
    }
    return v;
}

}
}
