#pragma once

#include <string>

#include "CommandRunner.h"
#include "ErrorCodes.h"
#include "HttpMessage.h"

namespace ConsoleGate {

/**
 * @brief POST /api/exec: {"command": "..."} in, {"output"|"error": "..."} out
 *
 * A missing "command" is treated as an empty command and rejected by the
 * runner; any other malformed body is a 400.
 */
class ExecEndpoint {
public:
    explicit ExecEndpoint(ICommandRunner& runner);

    HttpResponse handle(const std::string& method, const std::string& body,
                        const SubprocessExecutor::CancelCheck& cancelled) const;

    /**
     * @brief JSON error envelope for a request-level failure
     */
    static HttpResponse errorResponse(int status, Core::ErrorCode code);

    /**
     * @brief Extract the command string from a request body
     */
    static Result<std::string> parseCommand(const std::string& body);

private:
    ICommandRunner& runner_;
};

} // namespace ConsoleGate
