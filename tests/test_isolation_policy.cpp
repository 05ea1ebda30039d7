#include "sandbox/isolation_policy.h"
#include "sandbox/sandbox_factory.h"
#include "infrastructure/error_handling.h"
#include <cassert>
#include <iostream>
#include <string>

namespace quantbox {
namespace tests {

using namespace quantbox::sandbox;

template <typename Fn>
static bool throwsPolicy(Fn fn) {
    try {
        fn();
    } catch (const PolicyError& e) {
        return std::string(e.what()).size() > 0;
    }
    return false;
}

class IsolationPolicyTests {
public:
    static void runAll() {
        std::cout << "Running IsolationPolicy Tests...\n";

        testTierDefaults();
        testApplyLevelOverwrites();
        testValidationBounds();
        testModuleAllowList();
        testLevelNames();
        testFactoryPresets();

        std::cout << "All IsolationPolicy Tests Passed!\n";
    }

private:
    static void testTierDefaults() {
        std::cout << "  Testing tier defaults... ";

        IsolationPolicy def;
        assert(def.level == IsolationLevel::PRODUCTION);
        assert(def.maxExecutionTimeSec == 30);
        assert(def.maxMemoryMb == 256);
        assert(!def.allowNetwork);
        assert(!def.allowFileRead);
        assert(!def.allowFileWrite);

        IsolationPolicy dev(IsolationLevel::DEVELOPMENT);
        assert(dev.maxExecutionTimeSec == 60);
        assert(dev.maxMemoryMb == 512);
        assert(dev.allowNetwork);
        assert(dev.allowedDomains.size() == 1 && dev.allowedDomains[0] == "localhost:8000");
        assert(dev.allowFileRead);

        IsolationPolicy hard(IsolationLevel::HARDENED);
        assert(hard.maxExecutionTimeSec == 10);
        assert(hard.maxMemoryMb == 128);
        assert(hard.allowedImports == minimalAllowedImports());
        assert(hard.allowedImports.count("quantbox_safe") == 1);

        def.validate();
        dev.validate();
        hard.validate();

        std::cout << "PASSED\n";
    }

    static void testApplyLevelOverwrites() {
        std::cout << "  Testing applyLevel overwrites... ";

        IsolationPolicy p(IsolationLevel::DEVELOPMENT);
        p.allowFileWrite = true;
        p.allowedReadPaths.push_back("/data");
        p.allowedImports.insert("csv");

        p.applyLevel(IsolationLevel::HARDENED);
        assert(p.level == IsolationLevel::HARDENED);
        assert(!p.allowFileWrite);
        assert(!p.allowFileRead);
        assert(!p.allowNetwork);
        assert(p.allowedDomains.empty());
        assert(p.allowedReadPaths.empty());
        assert(p.allowedImports.count("csv") == 0);

        IsolationPolicy once(IsolationLevel::PRODUCTION);
        IsolationPolicy twice(IsolationLevel::PRODUCTION);
        twice.applyLevel(IsolationLevel::PRODUCTION);
        assert(once.describe() == twice.describe());
        assert(once.allowedImports == twice.allowedImports);

        std::cout << "PASSED\n";
    }

    static void testValidationBounds() {
        std::cout << "  Testing validation bounds... ";

        IsolationPolicy p;
        p.maxExecutionTimeSec = 0;
        assert(throwsPolicy([&p] { p.validate(); }));
        p.maxExecutionTimeSec = 301;
        assert(throwsPolicy([&p] { p.validate(); }));
        p.maxExecutionTimeSec = 300;
        p.validate();

        p.maxMemoryMb = 31;
        assert(throwsPolicy([&p] { p.validate(); }));
        p.maxMemoryMb = 2049;
        assert(throwsPolicy([&p] { p.validate(); }));
        p.maxMemoryMb = 32;
        p.validate();

        p.allowNetwork = true;
        p.allowedDomains.clear();
        assert(throwsPolicy([&p] { p.validate(); }));

        bool mentionsField = false;
        try {
            IsolationPolicy bad;
            bad.maxMemoryMb = 4096;
            bad.validate();
        } catch (const PolicyError& e) {
            mentionsField = std::string(e.what()).find("maxMemoryMb") != std::string::npos;
        }
        assert(mentionsField);

        std::cout << "PASSED\n";
    }

    static void testModuleAllowList() {
        std::cout << "  Testing module allow-list... ";

        IsolationPolicy p;
        assert(p.isModuleAllowed("math"));
        assert(p.isModuleAllowed("json.decoder"));
        assert(p.isModuleAllowed("collections.abc"));
        assert(!p.isModuleAllowed("os"));
        assert(!p.isModuleAllowed("os.path"));
        assert(!p.isModuleAllowed("subprocess"));
        assert(!p.isModuleAllowed(""));
        assert(!p.isModuleAllowed(".relative"));
        assert(!p.isModuleAllowed("mathx"));

        std::cout << "PASSED\n";
    }

    static void testLevelNames() {
        std::cout << "  Testing level names... ";

        assert(levelFromString("development") == IsolationLevel::DEVELOPMENT);
        assert(levelFromString("Production") == IsolationLevel::PRODUCTION);
        assert(levelFromString("HARDENED") == IsolationLevel::HARDENED);
        assert(throwsPolicy([] { levelFromString("paranoid"); }));
        assert(std::string(levelToString(IsolationLevel::HARDENED)) == "hardened");

        std::cout << "PASSED\n";
    }

    static void testFactoryPresets() {
        std::cout << "  Testing factory presets... ";

        auto analysis = SandboxFactory::analysisPolicy();
        assert(analysis.maxExecutionTimeSec == 30);
        assert(analysis.maxMemoryMb == 512);
        assert(analysis.allowNetwork);
        assert(analysis.isModuleAllowed("statistics"));

        auto filtering = SandboxFactory::filteringPolicy();
        assert(filtering.level == IsolationLevel::HARDENED);
        assert(filtering.maxExecutionTimeSec == 5);
        assert(filtering.maxMemoryMb == 128);
        assert(filtering.isModuleAllowed("re"));
        assert(!filtering.isModuleAllowed("math"));

        auto custom = SandboxFactory::createCustomSandbox(IsolationLevel::HARDENED, {"math"}, 7);
        assert(custom.policy().maxExecutionTimeSec == 7);
        assert(custom.policy().allowedImports.size() == 1);

        assert(throwsPolicy([] { SandboxFactory::createCustomSandbox(IsolationLevel::PRODUCTION, {}, 0); }));
        assert(throwsPolicy([] { SandboxFactory::createCustomSandbox(IsolationLevel::PRODUCTION, {}, 30, true); }));
        assert(throwsPolicy([] { SandboxFactory::createPreset("research"); }));
        assert(SandboxFactory::createPreset("filtering").policy().maxExecutionTimeSec == 5);
        assert(SandboxFactory::createAnalysisSandbox().policy().isModuleAllowed("textwrap"));
        assert(SandboxFactory::createPreset("analysis").policy().maxMemoryMb == 512);

        std::cout << "PASSED\n";
    }
};

}
}

int main() {
    quantbox::tests::IsolationPolicyTests::runAll();
    return 0;
}
