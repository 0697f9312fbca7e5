#include "ConsoleSettings.h"
#include "ErrorCodes.h"

#include <arpa/inet.h>
#include <sstream>
#include <unistd.h>

namespace ConsoleGate {

namespace {
    const char* const COMPONENT = "Settings";

    Error invalid(const std::string& what) {
        auto err = Core::ErrorRegistry::createError(Core::ErrorCode::INVALID_CONFIGURATION, COMPONENT);
        err.message += ": " + what;
        return err;
    }
}

ConsoleSettings ConsoleSettings::fromConfig(const Config& config) {
    ConsoleSettings settings;
    settings.listenAddress = config.get("listen_address", settings.listenAddress);
    settings.port = config.getInt("port", settings.port);
    settings.execTimeoutSeconds = config.getInt("exec_timeout_seconds", settings.execTimeoutSeconds);
    settings.demoMode = config.getBool("demo_mode", settings.demoMode);
    settings.trustedBinary = config.get("trusted_binary", "");
    settings.pathFallback = config.getBool("path_fallback", settings.pathFallback);
    settings.maxRequestBytes = config.getSize("max_request_bytes", settings.maxRequestBytes);
    settings.logLevel = config.get("log_level", settings.logLevel);
    settings.logFile = config.get("log_file", "");
    return settings;
}

const std::vector<std::string>& ConsoleSettings::knownKeys() {
    static const std::vector<std::string> keys = {
        "listen_address", "port", "exec_timeout_seconds", "demo_mode", "trusted_binary",
        "path_fallback", "max_request_bytes", "log_level", "log_file"
    };
    return keys;
}

VoidResult ConsoleSettings::validate() const {
    in_addr addr{};
    if (::inet_pton(AF_INET, listenAddress.c_str(), &addr) != 1) {
        return invalid("listen_address '" + listenAddress + "' is not an IPv4 address");
    }
    if (port < 0 || port > 65535) {
        return invalid("port " + std::to_string(port) + " is out of range");
    }
    if (execTimeoutSeconds <= 0) {
        return invalid("exec_timeout_seconds must be positive");
    }
    if (maxRequestBytes == 0) {
        return invalid("max_request_bytes must be positive");
    }
    if (!trustedBinary.empty()) {
        if (trustedBinary[0] != '/') {
            return invalid("trusted_binary must be an absolute path");
        }
        if (::access(trustedBinary.c_str(), X_OK) != 0) {
            return invalid("trusted_binary '" + trustedBinary + "' is not executable");
        }
    }
    return Ok();
}

std::string ConsoleSettings::configTemplate() {
    std::ostringstream ss;
    ss << "# ConsoleGate configuration\n";
    ss << "listen_address=127.0.0.1\n";
    ss << "port=7363\n";
    ss << "exec_timeout_seconds=30\n";
    ss << "demo_mode=false\n";
    ss << "# Absolute path of the CLI to run; empty runs this binary\n";
    ss << "trusted_binary=\n";
    ss << "path_fallback=true\n";
    ss << "max_request_bytes=1048576\n";
    ss << "log_level=INFO\n";
    ss << "# log_file=/path/to/consolegate.log\n";
    return ss.str();
}

} // namespace ConsoleGate
