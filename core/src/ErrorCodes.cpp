#include "ErrorCodes.h"
#include <unordered_map>

namespace ConsoleGate {
namespace Core {

namespace {
    const std::unordered_map<ErrorCode, std::string>& errorMessages() {
        static const std::unordered_map<ErrorCode, std::string> messages = {
            {ErrorCode::EMPTY_COMMAND, "empty command"},
            {ErrorCode::DANGEROUS_CHARACTERS, "contains dangerous characters"},
            {ErrorCode::COMMAND_NOT_ALLOWED, "command is not in the allowlist"},

            {ErrorCode::EXECUTION_CANCELLED, "request cancelled"},
            {ErrorCode::SELF_RESOLUTION_FAILED, "cannot resolve path of the running executable"},

            {ErrorCode::INVALID_REQUEST_BODY, "Invalid request body"},
            {ErrorCode::REQUEST_TOO_LARGE, "Request body too large"},
            {ErrorCode::METHOD_NOT_ALLOWED, "Method not allowed"},

            {ErrorCode::INTERNAL_ERROR, "Internal server error"},
            {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"}
        };
        return messages;
    }
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& messages = errorMessages();
    auto it = messages.find(code);
    if (it != messages.end()) {
        return it->second;
    }
    return "Unknown error";
}

Error ErrorRegistry::createError(ErrorCode code, const std::string& component) {
    return Error(getMessage(code), toInt(code), component);
}

} // namespace Core
} // namespace ConsoleGate
