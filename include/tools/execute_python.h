#pragma once

#include "engine/value.h"
#include "infrastructure/error_handling.h"
#include "sandbox/sandbox_manager.h"
#include <string>
#include <cstdint>

namespace quantbox {
namespace tools {

constexpr int MIN_TOOL_TIMEOUT_SEC = 1;
constexpr int MAX_TOOL_TIMEOUT_SEC = 120;

struct ExecutePythonRequest {
    std::string code;
    engine::Value context = engine::Value::object();
    int64_t timeoutSeconds = 30;
    std::string isolationLevel = "development";

    // Reads {code, context, timeout_seconds, isolation_level}.
    static Result<ExecutePythonRequest> fromJson(const engine::Value& json);
};

// Input checks that run before any process is launched.
Result<void> validateRequest(const ExecutePythonRequest& request);

// {success, result, stdout, stderr, execution_time_ms, error?}
engine::Value executePython(const ExecutePythonRequest& request);
engine::Value executePython(const engine::Value& request);

engine::Value toResponse(const sandbox::ExecutionResult& result);

}
}
