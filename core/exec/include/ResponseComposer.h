#pragma once

#include <optional>
#include <string>

#include "ExecutionResult.h"
#include "Result.h"

namespace ConsoleGate {

/**
 * @brief Envelope returned to the console for one command
 *
 * At most one of output/error is normally set. Serialized fields appear
 * only when present, so an empty but successful run yields {"output":""}.
 */
struct CommandResponse {
    std::optional<std::string> output;
    std::optional<std::string> error;
    int httpStatus{200};

    static CommandResponse withOutput(std::string text, int status = 200);
    static CommandResponse withError(std::string text, int status);

    std::string toJson() const;
};

/**
 * @brief Maps authorization and execution outcomes onto CommandResponse
 *
 *  - rejection              -> 403 "Command not allowed: <reason>"
 *  - launch/timeout/cancel  -> 200 "Command failed: <detail>"
 *  - completed              -> 200 output (stdout, else stderr), or
 *                              "Command failed: exit status N" when a
 *                              failing run printed nothing
 */
class ResponseComposer {
public:
    static CommandResponse compose(const Error& rejection);
    static CommandResponse compose(const ExecutionResult& result);

    static constexpr int HTTP_OK = 200;
    static constexpr int HTTP_FORBIDDEN = 403;
};

} // namespace ConsoleGate
