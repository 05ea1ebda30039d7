#include "tools/execute_python.h"
#include "sandbox/sandbox_factory.h"
#include "utils/logger.h"

namespace quantbox {
namespace tools {

static engine::Value errorResponse(const std::string& message) {
    engine::Value out = engine::Value::object();
    out["success"] = false;
    out["error"] = message;
    out["result"] = nullptr;
    out["execution_time_ms"] = 0;
    return out;
}

Result<ExecutePythonRequest> ExecutePythonRequest::fromJson(const engine::Value& json) {
    if (!json.is_object()) {
        return Error(ErrorCode::VALIDATION_FAILED, "request must be an object");
    }

    ExecutePythonRequest req;
    auto code = json.find("code");
    if (code != json.end()) {
        if (!code->is_string()) return Error(ErrorCode::VALIDATION_FAILED, "code must be non-empty string");
        req.code = code->get<std::string>();
    }

    auto context = json.find("context");
    if (context != json.end() && !context->is_null()) {
        req.context = *context;
    }

    auto timeout = json.find("timeout_seconds");
    if (timeout != json.end()) {
        if (!timeout->is_number_integer()) {
            return Error(ErrorCode::VALIDATION_FAILED, "timeout_seconds must be an integer");
        }
        req.timeoutSeconds = timeout->get<int64_t>();
    }

    auto level = json.find("isolation_level");
    if (level != json.end()) {
        if (!level->is_string()) return Error(ErrorCode::VALIDATION_FAILED, "isolation_level must be a string");
        req.isolationLevel = level->get<std::string>();
    }
    return req;
}

Result<void> validateRequest(const ExecutePythonRequest& request) {
    QUANTBOX_CHECK(!request.code.empty(), ErrorCode::VALIDATION_FAILED, "code must be non-empty string");
    QUANTBOX_CHECK(request.timeoutSeconds >= MIN_TOOL_TIMEOUT_SEC && request.timeoutSeconds <= MAX_TOOL_TIMEOUT_SEC,
                   ErrorCode::VALIDATION_FAILED, "timeout_seconds must be between 1-120 seconds");
    QUANTBOX_CHECK(request.context.is_object(), ErrorCode::VALIDATION_FAILED, "context must be a dictionary");

    auto check = sandbox::SandboxManager::validateCode(request.code);
    QUANTBOX_CHECK(check.valid, ErrorCode::VALIDATION_FAILED, "Code validation failed: " + check.message);
    return {};
}

engine::Value toResponse(const sandbox::ExecutionResult& result) {
    engine::Value out = engine::Value::object();
    out["success"] = result.success;
    out["result"] = result.success ? result.output : engine::Value(nullptr);
    out["stdout"] = result.stdoutText;
    out["stderr"] = result.stderrText;
    out["execution_time_ms"] = result.executionTimeMs;
    if (!result.success) {
        out["error"] = result.error.value_or(errorToString(result.errorCode));
    }
    return out;
}

engine::Value executePython(const ExecutePythonRequest& request) {
    auto valid = validateRequest(request);
    if (!valid.ok()) {
        LOG_WARN("execute_python rejected: " + valid.error().message);
        ErrorHandler::instance().handle(makeError(valid.error().code, valid.error().message, "execute_python"));
        return errorResponse(valid.error().message);
    }

    std::optional<sandbox::SandboxManager> manager;
    try {
        if (request.isolationLevel == "development") {
            manager = sandbox::SandboxFactory::createAnalysisSandbox();
        } else {
            sandbox::IsolationLevel level = sandbox::levelFromString(request.isolationLevel);
            manager = sandbox::SandboxFactory::createCustomSandbox(level, {},
                                                                   static_cast<uint32_t>(request.timeoutSeconds));
        }
    } catch (const QuantboxError& e) {
        ErrorHandler::instance().handle(makeError(e.code(), e.what(), "execute_python"));
        return errorResponse(std::string("Failed to create sandbox: ") + e.what());
    }

    auto result = manager->execute(request.code, request.context,
                                   static_cast<uint32_t>(request.timeoutSeconds));
    return toResponse(result);
}

engine::Value executePython(const engine::Value& request) {
    auto parsed = ExecutePythonRequest::fromJson(request);
    if (!parsed.ok()) {
        return errorResponse(parsed.error().message);
    }
    return executePython(parsed.value());
}

}
}
