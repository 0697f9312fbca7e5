#include "CommandRunner.h"
#include "ErrorCodes.h"
#include "InputSanitizer.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace ConsoleGate {

namespace {
    const char* const AUTH_COMPONENT = "Authorizer";
    const char* const EXEC_COMPONENT = "Executor";
}

SandboxedCommandRunner::SandboxedCommandRunner(const CommandAllowlist& allowlist, RunnerOptions options)
    : classifier_(allowlist), options_(std::move(options)) {}

Result<ClassificationResult> SandboxedCommandRunner::authorize(const std::string& command) const {
    auto clean = InputSanitizer::sanitize(command);
    if (clean.isError()) {
        Logger::instance().info("Rejected command: " + clean.error().message, AUTH_COMPONENT);
        return clean.error();
    }

    auto classification = classifier_.classify(clean.value());
    if (!classification.authorized) {
        Logger::instance().info("Rejected command not in allowlist: " + clean.value(), AUTH_COMPONENT);
        return Error(clean.value(), Core::toInt(Core::ErrorCode::COMMAND_NOT_ALLOWED), AUTH_COMPONENT);
    }

    LOG_DEBUG_COMP_IF("Authorized '" + clean.value() + "' via '" + classification.baseCommand + "'",
                      AUTH_COMPONENT);
    return classification;
}

CommandResponse SandboxedCommandRunner::run(const std::string& command,
                                            const SubprocessExecutor::CancelCheck& cancelled) {
    auto authorized = authorize(command);
    if (authorized.isError()) {
        return ResponseComposer::compose(authorized.error());
    }

    auto target = SelfExecutable::selectTarget(options_.trustedBinary, options_.pathFallback,
                                               options_.fallbackName);
    if (target.isError()) {
        ExecutionResult failed;
        failed.status = ExecutionStatus::LaunchFailed;
        failed.detail = target.error().message;
        return ResponseComposer::compose(failed);
    }

    SCOPED_TIMER_COMP("exec '" + authorized.value().baseCommand + "'", EXEC_COMPONENT);

    auto result = SubprocessExecutor::execute(authorized.value().tokens, target.value(),
                                              options_.timeout, cancelled);
    if (!result.succeeded()) {
        LOG_DEBUG_COMP_IF("'" + authorized.value().baseCommand + "' " + executionStatusToString(result.status) +
                          ": exit " + std::to_string(result.exitCode) +
                          " signal " + std::to_string(result.termSignal), EXEC_COMPONENT);
    }
    return ResponseComposer::compose(result);
}

} // namespace ConsoleGate
