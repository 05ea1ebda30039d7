#include "sandbox/child_process.h"
#include "infrastructure/error_handling.h"
#include "utils/logger.h"
#include <algorithm>
#include <chrono>
#include <thread>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/stat.h>

namespace quantbox {
namespace sandbox {

static std::string errnoText(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct ChildFailure {
    int stage;
    int err;
};

enum ChildStage {
    STAGE_SESSION = 1,
    STAGE_STDIO,
    STAGE_RLIMIT,
    STAGE_EXEC
};

const char* stageName(int stage) {
    switch (stage) {
        case STAGE_SESSION: return "setsid";
        case STAGE_STDIO: return "redirect stdio";
        case STAGE_RLIMIT: return "setrlimit";
        case STAGE_EXEC: return "exec";
        default: return "child setup";
    }
}

bool makePipe(UniqueFd& readEnd, UniqueFd& writeEnd) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) return false;
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

}

ScopedTempFile::ScopedTempFile(const std::string& dir, const std::string& prefix, const std::string& suffix) {
    std::string tmpl = dir.empty() ? "/tmp" : dir;
    if (tmpl.back() != '/') tmpl += '/';
    tmpl += prefix + "XXXXXX" + suffix;

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    fd_ = mkostemps(buf.data(), static_cast<int>(suffix.size()), O_CLOEXEC);
    if (fd_ < 0) {
        throw QuantboxError(ErrorCode::SETUP_FAILED, errnoText("Cannot create temporary file in " + dir, errno));
    }
    path_ = buf.data();
}

ScopedTempFile::~ScopedTempFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!path_.empty()) ::unlink(path_.c_str());
}

void ScopedTempFile::write(const std::string& content) {
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw QuantboxError(ErrorCode::SETUP_FAILED, errnoText("Cannot write " + path_, errno));
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

const std::vector<std::string>& deniedEnvironmentNames() {
    static const std::vector<std::string> names = {
        "AWS_SECRET_ACCESS_KEY",
        "AWS_ACCESS_KEY_ID",
        "ZERODHA_API_SECRET",
        "API_KEY",
        "SECRET_KEY"
    };
    return names;
}

std::vector<std::string> buildRestrictedEnvironment(const std::vector<std::string>& passthrough) {
    std::vector<std::pair<std::string, std::string>> vars;
    auto put = [&vars](const std::string& name, const std::string& value) {
        for (auto& v : vars) {
            if (v.first == name) {
                v.second = value;
                return;
            }
        }
        vars.emplace_back(name, value);
    };
    auto copyFromHost = [&put](const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (value) put(name, value);
    };

    copyFromHost("PATH");
    copyFromHost("HOME");
    put("PYTHONUNBUFFERED", "1");
    for (const auto& name : passthrough) {
        if (!name.empty() && name.find('=') == std::string::npos) copyFromHost(name);
    }

    const auto& denied = deniedEnvironmentNames();
    vars.erase(std::remove_if(vars.begin(), vars.end(), [&denied](const std::pair<std::string, std::string>& v) {
        return std::find(denied.begin(), denied.end(), v.first) != denied.end();
    }), vars.end());

    std::vector<std::string> env;
    env.reserve(vars.size());
    for (const auto& v : vars) env.push_back(v.first + "=" + v.second);
    return env;
}

static bool isExecutableFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

static std::string searchPath(const std::string& name) {
    const char* env = std::getenv("PATH");
    std::string path = env ? env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (isExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return "";
}

std::string resolveInterpreter(const std::string& configured) {
    if (!configured.empty()) {
        if (configured.find('/') != std::string::npos) {
            return isExecutableFile(configured) ? configured : "";
        }
        return searchPath(configured);
    }
    for (const char* candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
        if (isExecutableFile(candidate)) return candidate;
    }
    return searchPath("python3");
}

// Reads whatever is available without blocking. Bytes beyond `cap` are dropped.
static void drainFd(UniqueFd& fd, std::string& sink, uint64_t cap, bool& truncated) {
    char buffer[4096];
    while (fd.valid()) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = sink.size() < cap ? static_cast<size_t>(cap - sink.size()) : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            sink.append(buffer, take);
            if (take < static_cast<size_t>(n)) truncated = true;
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) fd.reset();
        return;
    }
}

static void killGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

static void reapBlocking(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

ProcessOutcome runProcess(const ProcessSpec& spec) {
    ProcessOutcome outcome;

    // Everything the child needs is laid out before fork; the child only
    // makes system calls.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& a : spec.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& e : spec.env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    struct rlimit memLimit;
    memLimit.rlim_cur = memLimit.rlim_max = static_cast<rlim_t>(spec.limits.memoryBytes);
    struct rlimit cpuLimit;
    cpuLimit.rlim_cur = cpuLimit.rlim_max = static_cast<rlim_t>(std::max<uint32_t>(spec.limits.cpuSeconds, 1));
    struct rlimit zeroLimit;
    zeroLimit.rlim_cur = zeroLimit.rlim_max = 0;
    struct rlimit fileLimit;
    fileLimit.rlim_cur = fileLimit.rlim_max = static_cast<rlim_t>(spec.limits.maxOpenFiles);
    const bool limitWrites = !spec.limits.allowFileWrite;

    UniqueFd outRead, outWrite, errRead, errWrite, statusRead, statusWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) || !makePipe(statusRead, statusWrite)) {
        throw QuantboxError(ErrorCode::SETUP_FAILED, errnoText("Cannot create pipes", errno));
    }
    UniqueFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devNull.valid()) {
        throw QuantboxError(ErrorCode::SETUP_FAILED, errnoText("Cannot open /dev/null", errno));
    }

    auto startTime = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        throw QuantboxError(ErrorCode::SETUP_FAILED, errnoText("Failed to fork process", errno));
    }

    if (pid == 0) {
        ChildFailure failure{0, 0};
        auto fail = [&](int stage) {
            failure.stage = stage;
            failure.err = errno;
            ssize_t ignored = ::write(statusWrite.get(), &failure, sizeof(failure));
            (void)ignored;
            ::_exit(127);
        };

        if (::setsid() < 0) fail(STAGE_SESSION);

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (::dup2(devNull.get(), STDIN_FILENO) < 0 ||
            ::dup2(outWrite.get(), STDOUT_FILENO) < 0 ||
            ::dup2(errWrite.get(), STDERR_FILENO) < 0) {
            fail(STAGE_STDIO);
        }

        if (setrlimit(RLIMIT_AS, &memLimit) < 0) fail(STAGE_RLIMIT);
        if (setrlimit(RLIMIT_CPU, &cpuLimit) < 0) fail(STAGE_RLIMIT);
        if (setrlimit(RLIMIT_CORE, &zeroLimit) < 0) fail(STAGE_RLIMIT);
        if (limitWrites && setrlimit(RLIMIT_FSIZE, &zeroLimit) < 0) fail(STAGE_RLIMIT);
        if (setrlimit(RLIMIT_NOFILE, &fileLimit) < 0) fail(STAGE_RLIMIT);

        ::execve(argv[0], argv.data(), envp.data());
        fail(STAGE_EXEC);
    }

    outWrite.reset();
    errWrite.reset();
    statusWrite.reset();
    devNull.reset();

    // The status pipe is close-on-exec: EOF means exec succeeded.
    ChildFailure failure{0, 0};
    ssize_t got;
    do {
        got = ::read(statusRead.get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    statusRead.reset();
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        reapBlocking(pid, status);
        throw QuantboxError(ErrorCode::SETUP_FAILED,
                            std::string("Cannot start ") + spec.executable + " (" + stageName(failure.stage) +
                            "): " + std::strerror(failure.err));
    }

    LOG_DEBUG("Started " + spec.executable + " pid=" + std::to_string(pid));

    ::fcntl(outRead.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(errRead.get(), F_SETFL, O_NONBLOCK);

    auto deadline = startTime + std::chrono::milliseconds(spec.limits.timeoutMs);
    bool reaped = false;
    bool groupKilled = false;
    int status = 0;

    while (outRead.valid() || errRead.valid() || !reaped) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.timedOut = true;
            break;
        }
        int remainingMs = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count()) + 1;
        int sliceMs = std::min(remainingMs, 50);

        if (outRead.valid() || errRead.valid()) {
            struct pollfd fds[2];
            nfds_t count = 0;
            if (outRead.valid()) fds[count++] = {outRead.get(), POLLIN, 0};
            if (errRead.valid()) fds[count++] = {errRead.get(), POLLIN, 0};

            int ready = ::poll(fds, count, sliceMs);
            if (ready < 0 && errno != EINTR) {
                int err = errno;
                killGroup(pid);
                if (!reaped) reapBlocking(pid, status);
                throw QuantboxError(ErrorCode::INTERNAL_ERROR, errnoText("poll failed", err));
            }
            drainFd(outRead, outcome.stdoutText, spec.maxOutputBytes, outcome.outputTruncated);
            drainFd(errRead, outcome.stderrText, spec.maxOutputBytes, outcome.outputTruncated);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(sliceMs, 10)));
        }

        if (!reaped) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
            } else if (r < 0 && errno == ECHILD) {
                reaped = true;
            }
        }

        // Leader is gone but something in its group still holds the pipes.
        if (reaped && !groupKilled && (outRead.valid() || errRead.valid())) {
            drainFd(outRead, outcome.stdoutText, spec.maxOutputBytes, outcome.outputTruncated);
            drainFd(errRead, outcome.stderrText, spec.maxOutputBytes, outcome.outputTruncated);
            ::kill(-pid, SIGKILL);
            groupKilled = true;
        }
    }

    if (outcome.timedOut) {
        killGroup(pid);
        if (!reaped) reapBlocking(pid, status);
        reaped = true;
        drainFd(outRead, outcome.stdoutText, spec.maxOutputBytes, outcome.outputTruncated);
        drainFd(errRead, outcome.stderrText, spec.maxOutputBytes, outcome.outputTruncated);
        LOG_WARN("Process " + std::to_string(pid) + " killed after " +
                 std::to_string(spec.limits.timeoutMs) + "ms");
    }

    outcome.elapsedMs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count());

    if (WIFEXITED(status)) {
        outcome.exited = true;
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.termSignal = WTERMSIG(status);
    }
    return outcome;
}

}
}
