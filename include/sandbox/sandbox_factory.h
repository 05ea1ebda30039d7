#pragma once

#include "sandbox/sandbox_manager.h"
#include <set>
#include <string>
#include <vector>

namespace quantbox {
namespace sandbox {

class SandboxFactory {
public:
    // PRODUCTION base with a wider module set, 30s, 512MB, network to localhost:8000.
    static SandboxManager createAnalysisSandbox();
    // HARDENED base limited to json, quantbox_safe and re; 5s, 128MB, no network.
    static SandboxManager createFilteringSandbox();
    static SandboxManager createCustomSandbox(IsolationLevel level = IsolationLevel::PRODUCTION,
                                              const std::set<std::string>& allowedImports = {},
                                              uint32_t maxTimeSec = 30,
                                              bool allowNetwork = false,
                                              const std::vector<std::string>& allowedDomains = {});
    static SandboxManager createDefaultSandbox();

    static IsolationPolicy analysisPolicy();
    static IsolationPolicy filteringPolicy();

    // "analysis", "filtering" or "default"; anything else throws PolicyError.
    static SandboxManager createPreset(const std::string& name);
};

}
}
