#include <gtest/gtest.h>
#include "sandbox/child_process.h"
#include "sandbox/guarded_program.h"
#include "infrastructure/error_handling.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unistd.h>

using namespace quantbox;
using namespace quantbox::sandbox;
using quantbox::engine::Value;

static bool hasEntry(const std::vector<std::string>& env, const std::string& prefix) {
    return std::any_of(env.begin(), env.end(), [&prefix](const std::string& e) {
        return e.compare(0, prefix.size(), prefix) == 0;
    });
}

static ProcessSpec shell(const std::string& command, uint32_t timeoutMs = 5000) {
    ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", command};
    spec.env = buildRestrictedEnvironment();
    spec.limits.timeoutMs = timeoutMs;
    spec.limits.cpuSeconds = timeoutMs / 1000 + 1;
    return spec;
}

TEST(RestrictedEnvironmentTest, KeepsBasicsAndStripsSecrets) {
    setenv("AWS_SECRET_ACCESS_KEY", "leak", 1);
    setenv("QUANTBOX_TEST_TZ", "UTC", 1);
    auto env = buildRestrictedEnvironment({"AWS_SECRET_ACCESS_KEY", "QUANTBOX_TEST_TZ", "BAD=NAME"});
    unsetenv("AWS_SECRET_ACCESS_KEY");
    unsetenv("QUANTBOX_TEST_TZ");

    EXPECT_TRUE(hasEntry(env, "PYTHONUNBUFFERED=1"));
    EXPECT_TRUE(hasEntry(env, "QUANTBOX_TEST_TZ=UTC"));
    EXPECT_FALSE(hasEntry(env, "AWS_SECRET_ACCESS_KEY="));
    EXPECT_FALSE(hasEntry(env, "BAD="));
    if (std::getenv("PATH")) EXPECT_TRUE(hasEntry(env, "PATH="));
}

TEST(RestrictedEnvironmentTest, DenyListIsFixed) {
    const auto& denied = deniedEnvironmentNames();
    EXPECT_EQ(denied.size(), 5u);
    EXPECT_NE(std::find(denied.begin(), denied.end(), "ZERODHA_API_SECRET"), denied.end());
    EXPECT_NE(std::find(denied.begin(), denied.end(), "SECRET_KEY"), denied.end());
}

TEST(InterpreterTest, ConfiguredPathMustBeExecutable) {
    EXPECT_EQ(resolveInterpreter("/nonexistent/python3"), "");
    EXPECT_EQ(resolveInterpreter("/bin/sh"), "/bin/sh");
    EXPECT_EQ(resolveInterpreter("definitely-not-a-python-binary"), "");
}

TEST(ScopedTempFileTest, UnlinksOnDestruction) {
    std::string path;
    {
        ScopedTempFile file("/tmp", "quantbox_test_", ".py");
        path = file.path();
        file.write("result = 1\n");
        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        EXPECT_EQ(line, "result = 1");
        EXPECT_EQ(path.substr(path.size() - 3), ".py");
    }
    EXPECT_NE(access(path.c_str(), F_OK), 0);
}

TEST(ScopedTempFileTest, MissingDirectoryThrows) {
    EXPECT_THROW(ScopedTempFile("/nonexistent/dir", "x_", ".py"), QuantboxError);
}

TEST(RunProcessTest, CapturesStreamsAndExitCode) {
    auto outcome = runProcess(shell("echo out; echo err >&2; exit 4"));
    EXPECT_FALSE(outcome.timedOut);
    EXPECT_TRUE(outcome.exited);
    EXPECT_EQ(outcome.exitCode, 4);
    EXPECT_EQ(outcome.stdoutText, "out\n");
    EXPECT_EQ(outcome.stderrText, "err\n");
    EXPECT_FALSE(outcome.outputTruncated);
}

TEST(RunProcessTest, StdinIsEmpty) {
    auto outcome = runProcess(shell("cat; echo done"));
    EXPECT_EQ(outcome.exitCode, 0);
    EXPECT_EQ(outcome.stdoutText, "done\n");
}

TEST(RunProcessTest, TimeoutKillsProcessGroup) {
    auto outcome = runProcess(shell("sleep 30 & sleep 30; echo never", 300));
    EXPECT_TRUE(outcome.timedOut);
    EXPECT_FALSE(outcome.exited);
    EXPECT_EQ(outcome.stdoutText, "");
    EXPECT_LT(outcome.elapsedMs, 3000u);
}

TEST(RunProcessTest, OutputIsCapped) {
    auto spec = shell("head -c 5000 /dev/zero | tr '\\0' 'x'");
    spec.maxOutputBytes = 1000;
    auto outcome = runProcess(spec);
    EXPECT_EQ(outcome.exitCode, 0);
    EXPECT_TRUE(outcome.outputTruncated);
    EXPECT_EQ(outcome.stdoutText.size(), 1000u);
}

TEST(RunProcessTest, SignalIsReported) {
    auto outcome = runProcess(shell("kill -TERM $$"));
    EXPECT_FALSE(outcome.exited);
    EXPECT_EQ(outcome.termSignal, 15);
}

TEST(RunProcessTest, FileWritesBlockedByDefault) {
    std::string target = "/tmp/quantbox_fsize_" + std::to_string(getpid());
    auto outcome = runProcess(shell("echo data > " + target + " && echo wrote"));
    EXPECT_NE(outcome.stdoutText, "wrote\n");
    unlink(target.c_str());
}

TEST(RunProcessTest, MissingExecutableIsSetupFailure) {
    ProcessSpec spec;
    spec.executable = "/nonexistent/binary";
    try {
        runProcess(spec);
        FAIL() << "expected QuantboxError";
    } catch (const QuantboxError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SETUP_FAILED);
        EXPECT_NE(std::string(e.what()).find("exec"), std::string::npos);
    }
}

TEST(GuardedProgramTest, StringLiteralEscapes) {
    EXPECT_EQ(pythonStringLiteral("plain"), "\"plain\"");
    EXPECT_EQ(pythonStringLiteral("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(pythonStringLiteral("\x01"), "\"\\u0001\"");
}

TEST(GuardedProgramTest, EmbedsPolicyAndScript) {
    IsolationPolicy policy(IsolationLevel::HARDENED);
    Value context = Value::parse(R"({"symbol": "ACME", "qty": 3})");
    std::string program = composeGuardedProgram(policy, "result = qty * 2", context, "/opt/quantbox/python");

    EXPECT_NE(program.find("allowed = frozenset([\"json\", \"math\", \"quantbox_safe\", \"statistics\"])"),
              std::string::npos);
    EXPECT_NE(program.find("builtins.__import__ = guarded_import"), std::string::npos);
    EXPECT_NE(program.find("script_globals[\"open\"] = denied_open"), std::string::npos);
    EXPECT_NE(program.find("\"/opt/quantbox/python\""), std::string::npos);
    EXPECT_NE(program.find("\"result = qty * 2\""), std::string::npos);
    EXPECT_NE(program.find("allow_nan=False"), std::string::npos);
    EXPECT_NE(program.find("sys._getframe(1)"), std::string::npos);
    const std::string tail = "raise SystemExit(_quantbox_main())\n";
    EXPECT_EQ(program.rfind(tail), program.size() - tail.size());
}

TEST(GuardedProgramTest, FileGuardFollowsPolicy) {
    IsolationPolicy dev(IsolationLevel::DEVELOPMENT);
    std::string program = composeGuardedProgram(dev, "result = 1", Value::object());
    EXPECT_EQ(program.find("denied_open"), std::string::npos);
}

TEST(GuardedProgramTest, RejectsUnusableContext) {
    IsolationPolicy policy;
    EXPECT_THROW(composeGuardedProgram(policy, "x = 1", Value::array()), QuantboxError);
    EXPECT_THROW(composeGuardedProgram(policy, "x = 1", Value("text")), QuantboxError);

    Value inf = Value::object();
    inf["nested"] = Value::array({1.0, std::numeric_limits<double>::infinity()});
    try {
        composeGuardedProgram(policy, "x = 1", inf);
        FAIL() << "expected QuantboxError";
    } catch (const QuantboxError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SETUP_FAILED);
    }
}
