#include "sandbox/sandbox_factory.h"
#include "utils/logger.h"

namespace quantbox {
namespace sandbox {

IsolationPolicy SandboxFactory::analysisPolicy() {
    IsolationPolicy policy(IsolationLevel::PRODUCTION);
    for (const char* module : {"calendar", "numbers", "pprint", "textwrap"}) {
        policy.allowedImports.insert(module);
    }
    policy.maxExecutionTimeSec = 30;
    policy.maxMemoryMb = 512;
    policy.allowNetwork = true;
    policy.allowedDomains = {"localhost:8000"};
    return policy;
}

IsolationPolicy SandboxFactory::filteringPolicy() {
    IsolationPolicy policy(IsolationLevel::HARDENED);
    policy.allowedImports = {"json", "quantbox_safe", "re"};
    policy.maxExecutionTimeSec = 5;
    policy.maxMemoryMb = 128;
    policy.allowNetwork = false;
    policy.allowedDomains.clear();
    return policy;
}

SandboxManager SandboxFactory::createAnalysisSandbox() {
    return SandboxManager(SandboxConfig(analysisPolicy()));
}

SandboxManager SandboxFactory::createFilteringSandbox() {
    return SandboxManager(SandboxConfig(filteringPolicy()));
}

SandboxManager SandboxFactory::createCustomSandbox(IsolationLevel level,
                                                   const std::set<std::string>& allowedImports,
                                                   uint32_t maxTimeSec,
                                                   bool allowNetwork,
                                                   const std::vector<std::string>& allowedDomains) {
    IsolationPolicy policy(level);
    policy.allowNetwork = allowNetwork;
    policy.allowedDomains = allowedDomains;
    if (!allowedImports.empty()) policy.allowedImports = allowedImports;
    policy.maxExecutionTimeSec = maxTimeSec;

    LOG_DEBUG("Custom sandbox: " + policy.describe());
    return SandboxManager(SandboxConfig(policy));
}

SandboxManager SandboxFactory::createDefaultSandbox() {
    return SandboxManager(SandboxConfig(IsolationPolicy(IsolationLevel::PRODUCTION)));
}

SandboxManager SandboxFactory::createPreset(const std::string& name) {
    if (name == "analysis") return createAnalysisSandbox();
    if (name == "filtering") return createFilteringSandbox();
    if (name == "default") return createDefaultSandbox();
    throw PolicyError("Unknown sandbox preset '" + name + "' (expected analysis, filtering or default)");
}

}
}
