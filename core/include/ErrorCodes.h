#pragma once

#include <string>

#include "Result.h"

namespace ConsoleGate {
namespace Core {

enum class ErrorCode : int {
    // Authorization Errors (1000-1999)
    EMPTY_COMMAND = 1000,
    DANGEROUS_CHARACTERS = 1001,
    COMMAND_NOT_ALLOWED = 1002,

    // Execution Errors (2000-2999)
    EXECUTION_CANCELLED = 2002,
    SELF_RESOLUTION_FAILED = 2003,

    // Request Errors (3000-3999)
    INVALID_REQUEST_BODY = 3000,
    REQUEST_TOO_LARGE = 3001,
    METHOD_NOT_ALLOWED = 3002,

    // System Errors (5000-5999)
    INTERNAL_ERROR = 5001,
    INVALID_CONFIGURATION = 5002
};

class ErrorRegistry {
public:
    /**
     * @brief Canonical human-readable text for a code
     *
     * Authorization codes map to the reason strings shown to callers
     * after "Command not allowed: ".
     */
    static std::string getMessage(ErrorCode code);

    /**
     * @brief Build an Error carrying the canonical message for code
     */
    static Error createError(ErrorCode code, const std::string& component = "");
};

inline int toInt(ErrorCode code) {
    return static_cast<int>(code);
}

} // namespace Core
} // namespace ConsoleGate
