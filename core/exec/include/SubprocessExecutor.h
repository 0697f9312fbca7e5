#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "ExecutionResult.h"
#include "SelfExecutable.h"

namespace ConsoleGate {

/**
 * @brief Runs one argv without a shell, under a wall-clock deadline
 *
 * The child gets its own process group, /dev/null on stdin and separate
 * pipes for stdout and stderr. When the deadline passes, or the cancel
 * check reports that the caller is gone, the whole group is killed with
 * SIGKILL and the partial output is dropped.
 *
 * Exit status is reported, not judged: a non-zero exit is still a
 * Completed result.
 */
class SubprocessExecutor {
public:
    using CancelCheck = std::function<bool()>;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

    /**
     * @param tokens argument vector passed after argv[0]
     * @param target binary to execute (argv[0])
     * @param timeout hard wall-clock limit for the whole invocation
     * @param cancelled polled while waiting; returning true kills the child
     */
    static ExecutionResult execute(const std::vector<std::string>& tokens,
                                   const ExecutableTarget& target,
                                   std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                                   const CancelCheck& cancelled = CancelCheck());

    /**
     * @brief Search $PATH for an executable file named name
     * @return absolute path, or "" if not found
     */
    static std::string findInPath(const std::string& name);

    /**
     * @brief "30s" for whole seconds, "1500ms" otherwise
     */
    static std::string formatDuration(std::chrono::milliseconds duration);
};

} // namespace ConsoleGate
