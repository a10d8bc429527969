// =============================================================================
// genoqc - External Process Runner Implementation
// =============================================================================

#include "gqc/qc/process.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <thread>

#include "gqc/common/logger.h"
#include "gqc/common/strings.h"

namespace gqc::qc {

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Polling period of the wait loop.
constexpr std::chrono::milliseconds kWaitSlice{20};

/// @brief Owns a file descriptor.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

/// @brief Block until @p pid changes state, retrying on EINTR.
pid_t waitBlocking(pid_t pid, int& status) {
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    return result;
}

/// @brief SIGTERM the process group, SIGKILL it after @p grace.
void terminateGroup(pid_t pid, std::chrono::milliseconds grace, int& status) {
    ::kill(-pid, SIGTERM);
    const auto deadline = Clock::now() + grace;
    while (Clock::now() < deadline) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            // Leader gone; make sure no helper survives it.
            ::kill(-pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(kWaitSlice);
    }
    ::kill(-pid, SIGKILL);
    waitBlocking(pid, status);
}

}  // namespace

std::string ProcessResult::describe() const {
    std::string text;
    if (exitCode) {
        text = std::format("exit {}", *exitCode);
    } else if (termSignal) {
        text = std::format("killed by signal {}", *termSignal);
    } else {
        text = "not started";
    }
    if (timedOut) {
        text += " after timeout";
    } else if (cancelled) {
        text += " after cancellation";
    }
    return text;
}

std::optional<std::filesystem::path> findExecutable(const std::string& executable) {
    if (executable.empty()) {
        return std::nullopt;
    }
    if (executable.find('/') != std::string::npos) {
        if (::access(executable.c_str(), X_OK) == 0) {
            return std::filesystem::path(executable);
        }
        return std::nullopt;
    }
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }
    for (auto dir : split(pathEnv, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / executable;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<ProcessResult> runProcess(const ProcessSpec& spec, const CancellationToken* cancellation) {
    if (spec.executable.empty()) {
        return makeError(ErrorCode::kToolError, "no executable given");
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argvStorage;
    argvStorage.reserve(spec.args.size() + 1);
    argvStorage.push_back(spec.executable);
    argvStorage.insert(argvStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1);
    for (auto& arg : argvStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string logPath = spec.logPath.empty() ? "/dev/null" : spec.logPath.string();
    FileDescriptor logFd(::open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!logFd.valid()) {
        return makeError(ErrorCode::kToolError, "cannot open log '{}': {}", logPath,
                         std::strerror(errno));
    }
    FileDescriptor nullFd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!nullFd.valid()) {
        return makeError(ErrorCode::kToolError, "cannot open /dev/null: {}", std::strerror(errno));
    }

    // exec() failures travel back through a close-on-exec pipe.
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        return makeError(ErrorCode::kToolError, "pipe2 failed: {}", std::strerror(errno));
    }
    FileDescriptor errorRead(errorPipe[0]);
    FileDescriptor errorWrite(errorPipe[1]);

    const std::string workingDir = spec.workingDir.string();
    const auto started = Clock::now();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return makeError(ErrorCode::kToolError, "fork failed: {}", std::strerror(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        ::dup2(nullFd.get(), STDIN_FILENO);
        ::dup2(logFd.get(), STDOUT_FILENO);
        ::dup2(logFd.get(), STDERR_FILENO);
        if (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0) {
            const int err = errno;
            [[maybe_unused]] auto n = ::write(errorWrite.get(), &err, sizeof(err));
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        const int err = errno;
        [[maybe_unused]] auto n = ::write(errorWrite.get(), &err, sizeof(err));
        ::_exit(127);
    }

    // Parent. Either setpgid call may win the race; both have the same effect.
    ::setpgid(pid, pid);
    errorWrite.reset();

    int childErrno = 0;
    ssize_t got;
    do {
        got = ::read(errorRead.get(), &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        waitBlocking(pid, status);
        return makeError(ErrorCode::kToolError, "cannot execute '{}': {}", spec.executable,
                         std::strerror(childErrno));
    }

    GQC_LOG_DEBUG("Started {} (pid {})", spec.executable, pid);

    ProcessResult result;
    int status = 0;
    const bool bounded = spec.timeout.count() > 0;
    const auto deadline = started + spec.timeout;

    while (true) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            return makeError(ErrorCode::kToolError, "waitpid failed: {}", std::strerror(errno));
        }
        if (cancellation != nullptr && cancellation->isCancelled()) {
            result.cancelled = true;
            terminateGroup(pid, spec.killGrace, status);
            break;
        }
        if (bounded && Clock::now() >= deadline) {
            result.timedOut = true;
            GQC_LOG_WARNING("{} (pid {}) exceeded {} ms; terminating", spec.executable, pid,
                            spec.timeout.count());
            terminateGroup(pid, spec.killGrace, status);
            break;
        }
        std::this_thread::sleep_for(kWaitSlice);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }
    GQC_LOG_DEBUG("{} (pid {}) finished: {}", spec.executable, pid, result.describe());
    return result;
}

}  // namespace gqc::qc
