#pragma once

#include <functional>
#include <string>

#include "Result.h"

namespace ConsoleGate {

/**
 * @brief Binary the executor should launch
 */
struct ExecutableTarget {
    std::string path;             // absolute path, or a bare name when viaPathLookup
    bool viaPathLookup{false};    // resolved through $PATH (weaker than a fixed path)
};

/**
 * @brief Locates the trusted binary for command execution
 */
class SelfExecutable {
public:
    using Resolver = std::function<Result<std::string>()>;

    /**
     * @brief Absolute path of the running executable (via /proc/self/exe)
     */
    static Result<std::string> resolve();

    /**
     * @brief Pick the binary to run
     *
     * Order: configuredPath if non-empty, then the running executable,
     * then fallbackName through $PATH when allowPathFallback is set.
     * With the fallback disabled a resolution failure is returned as-is.
     */
    static Result<ExecutableTarget> selectTarget(const std::string& configuredPath,
                                                 bool allowPathFallback,
                                                 const std::string& fallbackName,
                                                 const Resolver& resolver = resolve);
};

} // namespace ConsoleGate
