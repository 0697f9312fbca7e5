#include "ExecEndpoint.h"
#include "LoggerMacros.h"
#include "ResponseComposer.h"

#include <json/json.h>
#include <memory>

namespace ConsoleGate {

namespace {
    const char* const COMPONENT = "ExecEndpoint";
}

ExecEndpoint::ExecEndpoint(ICommandRunner& runner)
    : runner_(runner) {
}

HttpResponse ExecEndpoint::errorResponse(int status, Core::ErrorCode code) {
    HttpResponse response;
    response.status = status;
    response.body = CommandResponse::withError(Core::ErrorRegistry::getMessage(code), status).toJson();
    return response;
}

Result<std::string> ExecEndpoint::parseCommand(const std::string& body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["rejectDupKeys"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        LOG_DEBUG_COMP_IF("Unparseable request body: " + errs, COMPONENT);
        return Core::ErrorRegistry::createError(Core::ErrorCode::INVALID_REQUEST_BODY, COMPONENT);
    }
    if (!root.isObject()) {
        return Core::ErrorRegistry::createError(Core::ErrorCode::INVALID_REQUEST_BODY, COMPONENT);
    }

    const Json::Value& command = root["command"];
    if (command.isNull()) {
        return std::string();
    }
    if (!command.isString()) {
        return Core::ErrorRegistry::createError(Core::ErrorCode::INVALID_REQUEST_BODY, COMPONENT);
    }
    return command.asString();
}

HttpResponse ExecEndpoint::handle(const std::string& method, const std::string& body,
                                  const SubprocessExecutor::CancelCheck& cancelled) const {
    if (method != "POST") {
        return errorResponse(405, Core::ErrorCode::METHOD_NOT_ALLOWED);
    }

    auto command = parseCommand(body);
    if (command.isError()) {
        return errorResponse(400, Core::ErrorCode::INVALID_REQUEST_BODY);
    }

    CommandResponse result = runner_.run(command.value(), cancelled);

    HttpResponse response;
    response.status = result.httpStatus;
    response.body = result.toJson();
    return response;
}

} // namespace ConsoleGate
