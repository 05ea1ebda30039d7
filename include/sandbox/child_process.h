#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace quantbox {
namespace sandbox {

// Temporary file created with mkstemps and unlinked when the object goes away.
class ScopedTempFile {
public:
    ScopedTempFile(const std::string& dir, const std::string& prefix, const std::string& suffix);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    void write(const std::string& content);
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

struct ProcessLimits {
    uint32_t timeoutMs = 30000;
    uint64_t memoryBytes = 256ULL * 1024 * 1024;
    uint32_t cpuSeconds = 31;
    bool allowFileWrite = false;
    uint32_t maxOpenFiles = 64;
};

struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::vector<std::string> env;
    ProcessLimits limits;
    uint64_t maxOutputBytes = 1024 * 1024;
};

struct ProcessOutcome {
    bool timedOut = false;
    bool exited = false;
    int exitCode = -1;
    int termSignal = 0;
    std::string stdoutText;
    std::string stderrText;
    bool outputTruncated = false;
    uint64_t elapsedMs = 0;
};

const std::vector<std::string>& deniedEnvironmentNames();

// PATH and HOME from the host when set, PYTHONUNBUFFERED=1 and any
// passthrough names, minus the deny-list. Entries are NAME=value.
std::vector<std::string> buildRestrictedEnvironment(const std::vector<std::string>& passthrough = {});

// Absolute path of the interpreter to launch, or "" when none is found.
std::string resolveInterpreter(const std::string& configured = "");

// Runs the process in its own session with stdin on /dev/null and the given
// rlimits applied. Throws QuantboxError(SETUP_FAILED) when it cannot be started.
ProcessOutcome runProcess(const ProcessSpec& spec);

}
}
