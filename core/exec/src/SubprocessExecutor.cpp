#include "SubprocessExecutor.h"
#include "ErrorCodes.h"
#include "FdGuard.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace ConsoleGate {

namespace {

    const char* const COMPONENT = "Executor";
    constexpr int POLL_SLICE_MS = 50;
    constexpr size_t READ_CHUNK = 8192;

    using Clock = std::chrono::steady_clock;

    bool makePipe(FdGuard& readEnd, FdGuard& writeEnd) {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        readEnd.reset(fds[0]);
        writeEnd.reset(fds[1]);
        return true;
    }

    int reap(pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return -1;
            }
        }
        return status;
    }

    void killGroupAndReap(pid_t pid) {
        // Group id equals pid: the child calls setpgid(0, 0) before exec.
        if (::kill(-pid, SIGKILL) != 0) {
            ::kill(pid, SIGKILL);
        }
        reap(pid);
    }

    // Reads whatever is available; returns false once the pipe hit EOF or failed.
    bool drain(int fd, std::string& sink) {
        std::array<char, READ_CHUNK> buffer;
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            return true;
        }
        return false;
    }

    std::string describeLaunchFailure(const std::string& path, int err) {
        return "failed to start " + path + ": " + std::strerror(err);
    }

    ExecutionResult failure(ExecutionStatus status, std::string detail, bool viaPath) {
        ExecutionResult result;
        result.status = status;
        result.detail = std::move(detail);
        result.usedPathFallback = viaPath;
        return result;
    }

}

std::string SubprocessExecutor::findInPath(const std::string& name) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return "";
    }

    const char* pathEnv = std::getenv("PATH");
    std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";

    std::stringstream ss(searchPath);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        // An empty PATH element means the current directory; never honor it here.
        if (dir.empty() || dir[0] != '/') {
            continue;
        }
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

std::string SubprocessExecutor::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000) + "s";
    }
    return std::to_string(ms) + "ms";
}

ExecutionResult SubprocessExecutor::execute(const std::vector<std::string>& tokens,
                                            const ExecutableTarget& target,
                                            std::chrono::milliseconds timeout,
                                            const CancelCheck& cancelled) {
    auto& logger = Logger::instance();

    std::string binary = target.path;
    if (target.viaPathLookup) {
        binary = findInPath(target.path);
        if (binary.empty()) {
            logger.error("PATH fallback could not find '" + target.path + "'", COMPONENT);
            return failure(ExecutionStatus::LaunchFailed,
                           "executable '" + target.path + "' not found in PATH", true);
        }
        logger.warn("Executing via PATH fallback: " + binary, COMPONENT);
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(tokens.size() + 2);
    argv.push_back(const_cast<char*>(binary.c_str()));
    for (const auto& token : tokens) {
        argv.push_back(const_cast<char*>(token.c_str()));
    }
    argv.push_back(nullptr);

    FdGuard outRead, outWrite, errRead, errWrite, statusRead, statusWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) || !makePipe(statusRead, statusWrite)) {
        int err = errno;
        logger.error("Failed to create pipes: " + std::string(std::strerror(err)), COMPONENT);
        return failure(ExecutionStatus::LaunchFailed, describeLaunchFailure(binary, err), target.viaPathLookup);
    }

    FdGuard devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devNull) {
        int err = errno;
        logger.error("Failed to open /dev/null: " + std::string(std::strerror(err)), COMPONENT);
        return failure(ExecutionStatus::LaunchFailed, describeLaunchFailure(binary, err), target.viaPathLookup);
    }

    LOG_DEBUG_COMP_IF("Spawning " + binary + " with " + std::to_string(tokens.size()) + " argument(s)", COMPONENT);

    auto deadline = Clock::now() + timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        logger.error("fork() failed: " + std::string(std::strerror(err)), COMPONENT);
        return failure(ExecutionStatus::LaunchFailed, describeLaunchFailure(binary, err), target.viaPathLookup);
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        if (::dup2(devNull.get(), STDIN_FILENO) < 0 ||
            ::dup2(outWrite.get(), STDOUT_FILENO) < 0 ||
            ::dup2(errWrite.get(), STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = ::write(statusWrite.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execv(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(statusWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    outWrite.reset();
    errWrite.reset();
    statusWrite.reset();
    devNull.reset();

    int childErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(statusRead.get(), &childErrno, sizeof(childErrno));
    } while (statusBytes < 0 && errno == EINTR);

    if (statusBytes == static_cast<ssize_t>(sizeof(childErrno))) {
        reap(pid);
        logger.error("Launch failed for " + binary + ": " + std::strerror(childErrno), COMPONENT);
        return failure(ExecutionStatus::LaunchFailed, describeLaunchFailure(binary, childErrno), target.viaPathLookup);
    }
    statusRead.reset();

    ExecutionResult result;
    result.usedPathFallback = target.viaPathLookup;

    auto killWith = [&](ExecutionStatus status, const std::string& detail) {
        killGroupAndReap(pid);
        return failure(status, detail, target.viaPathLookup);
    };

    // Collect output until both pipes close.
    while (outRead || errRead) {
        if (cancelled && cancelled()) {
            logger.warn("Caller went away; killing " + binary + " (pid " + std::to_string(pid) + ")", COMPONENT);
            return killWith(ExecutionStatus::Cancelled, Core::ErrorRegistry::getMessage(Core::ErrorCode::EXECUTION_CANCELLED));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            logger.warn("Timeout after " + formatDuration(timeout) + "; killing " + binary +
                        " (pid " + std::to_string(pid) + ")", COMPONENT);
            return killWith(ExecutionStatus::TimedOut, "command timed out after " + formatDuration(timeout));
        }

        std::array<pollfd, 2> fds{};
        fds[0].fd = outRead ? outRead.get() : -1;
        fds[0].events = POLLIN;
        fds[1].fd = errRead ? errRead.get() : -1;
        fds[1].events = POLLIN;

        int slice = static_cast<int>(std::min<long long>(remaining.count(), POLL_SLICE_MS));
        int ready = ::poll(fds.data(), fds.size(), slice);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            logger.error("poll() failed: " + std::string(std::strerror(err)), COMPONENT);
            return killWith(ExecutionStatus::LaunchFailed, "failed to read output: " + std::string(std::strerror(err)));
        }
        if (ready == 0) {
            continue;
        }

        if (outRead && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!drain(outRead.get(), result.stdoutText)) {
                outRead.reset();
            }
        }
        if (errRead && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!drain(errRead.get(), result.stderrText)) {
                errRead.reset();
            }
        }
    }

    // Both pipes closed; the process may still be running.
    int status = 0;
    for (;;) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            int err = errno;
            logger.error("waitpid() failed: " + std::string(std::strerror(err)), COMPONENT);
            return failure(ExecutionStatus::LaunchFailed, "failed to wait for process: " + std::string(std::strerror(err)),
                           target.viaPathLookup);
        }
        if (cancelled && cancelled()) {
            return killWith(ExecutionStatus::Cancelled, Core::ErrorRegistry::getMessage(Core::ErrorCode::EXECUTION_CANCELLED));
        }
        if (Clock::now() >= deadline) {
            logger.warn("Timeout after " + formatDuration(timeout) + "; killing " + binary, COMPONENT);
            return killWith(ExecutionStatus::TimedOut, "command timed out after " + formatDuration(timeout));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.status = ExecutionStatus::Completed;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    }

    LOG_DEBUG_COMP_IF(binary + " finished: exit=" + std::to_string(result.exitCode) +
                      " signal=" + std::to_string(result.termSignal) +
                      " stdout=" + std::to_string(result.stdoutText.size()) + "B" +
                      " stderr=" + std::to_string(result.stderrText.size()) + "B", COMPONENT);
    return result;
}

} // namespace ConsoleGate
