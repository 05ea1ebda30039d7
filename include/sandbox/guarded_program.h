#pragma once

#include "sandbox/isolation_policy.h"
#include "engine/value.h"
#include <string>

namespace quantbox {
namespace sandbox {

// Exit statuses of the composed program besides 0.
constexpr int EXIT_SCRIPT_FAILED = 1;
constexpr int EXIT_OUTPUT_CONTRACT = 3;

// Double-quoted literal that evaluates to `text` (invalid UTF-8 is replaced).
std::string pythonStringLiteral(const std::string& text);

// Builds the program text run by the child: import guard, file guard, context
// bindings, the user script and result capture. Throws QuantboxError
// (SETUP_FAILED) when the context is not a representable JSON object.
std::string composeGuardedProgram(const IsolationPolicy& policy,
                                  const std::string& script,
                                  const engine::Value& context,
                                  const std::string& enginePath = "");

}
}
