#pragma once

#include <chrono>
#include <string>

#include "CommandAllowlist.h"
#include "CommandClassifier.h"
#include "ResponseComposer.h"
#include "SelfExecutable.h"
#include "SubprocessExecutor.h"

namespace ConsoleGate {

/**
 * @brief Turns one raw command string into a console response
 *
 * Implementations must be safe to call from several request threads at once.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual CommandResponse run(const std::string& command,
                                const SubprocessExecutor::CancelCheck& cancelled) = 0;

    virtual const char* name() const = 0;
};

struct RunnerOptions {
    std::string trustedBinary;        // empty: execute ourselves
    bool pathFallback{true};
    std::string fallbackName{"consolegate"};
    std::chrono::milliseconds timeout{SubprocessExecutor::DEFAULT_TIMEOUT};
};

/**
 * @brief Sanitize, classify, execute, compose
 *
 * Rejections short-circuit to the composer without spawning anything.
 */
class SandboxedCommandRunner : public ICommandRunner {
public:
    SandboxedCommandRunner(const CommandAllowlist& allowlist, RunnerOptions options);

    // Disable copy
    SandboxedCommandRunner(const SandboxedCommandRunner&) = delete;
    SandboxedCommandRunner& operator=(const SandboxedCommandRunner&) = delete;

    CommandResponse run(const std::string& command,
                        const SubprocessExecutor::CancelCheck& cancelled) override;

    const char* name() const override { return "sandboxed"; }

    /**
     * @brief Authorization half of run(): tokens on success, rejection otherwise
     */
    Result<ClassificationResult> authorize(const std::string& command) const;

    const RunnerOptions& options() const { return options_; }

private:
    CommandClassifier classifier_;
    RunnerOptions options_;
};

/**
 * @brief Canned output keyed on the first two tokens; never spawns a process
 */
class DemoCommandRunner : public ICommandRunner {
public:
    CommandResponse run(const std::string& command,
                        const SubprocessExecutor::CancelCheck& cancelled) override;

    const char* name() const override { return "demo"; }

    static std::string cannedOutput(const std::string& command);
};

} // namespace ConsoleGate
