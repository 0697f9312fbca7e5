#pragma once

#include <string>

namespace ConsoleGate {

enum class ExecutionStatus {
    Completed,      // process ran and was reaped; see exitCode/termSignal
    LaunchFailed,   // process could not be started
    TimedOut,       // killed at the deadline, output discarded
    Cancelled       // killed because the caller went away, output discarded
};

struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::LaunchFailed};
    std::string stdoutText;
    std::string stderrText;
    int exitCode{-1};      // valid when the process exited normally
    int termSignal{0};     // non-zero when the process was killed by a signal
    std::string detail;    // failure description for LaunchFailed/TimedOut/Cancelled
    bool usedPathFallback{false};

    bool completed() const { return status == ExecutionStatus::Completed; }

    bool succeeded() const {
        return status == ExecutionStatus::Completed && termSignal == 0 && exitCode == 0;
    }
};

inline const char* executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::LaunchFailed: return "launch-failed";
        case ExecutionStatus::TimedOut: return "timed-out";
        case ExecutionStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

} // namespace ConsoleGate
