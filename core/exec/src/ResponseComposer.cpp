#include "ResponseComposer.h"

#include <json/json.h>

namespace ConsoleGate {

namespace {
    const std::string NOT_ALLOWED_PREFIX = "Command not allowed: ";
    const std::string FAILED_PREFIX = "Command failed: ";
}

CommandResponse CommandResponse::withOutput(std::string text, int status) {
    CommandResponse response;
    response.output = std::move(text);
    response.httpStatus = status;
    return response;
}

CommandResponse CommandResponse::withError(std::string text, int status) {
    CommandResponse response;
    response.error = std::move(text);
    response.httpStatus = status;
    return response;
}

std::string CommandResponse::toJson() const {
    Json::Value root(Json::objectValue);
    if (output) {
        root["output"] = *output;
    }
    if (error) {
        root["error"] = *error;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

CommandResponse ResponseComposer::compose(const Error& rejection) {
    return CommandResponse::withError(NOT_ALLOWED_PREFIX + rejection.message, HTTP_FORBIDDEN);
}

CommandResponse ResponseComposer::compose(const ExecutionResult& result) {
    if (!result.completed()) {
        return CommandResponse::withError(FAILED_PREFIX + result.detail, HTTP_OK);
    }

    const std::string& text = result.stdoutText.empty() ? result.stderrText : result.stdoutText;

    if (result.succeeded() || !text.empty()) {
        return CommandResponse::withOutput(text, HTTP_OK);
    }

    if (result.termSignal != 0) {
        return CommandResponse::withError(FAILED_PREFIX + "signal " + std::to_string(result.termSignal), HTTP_OK);
    }
    return CommandResponse::withError(FAILED_PREFIX + "exit status " + std::to_string(result.exitCode), HTTP_OK);
}

} // namespace ConsoleGate
