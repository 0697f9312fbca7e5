#include "SelfExecutable.h"
#include "ErrorCodes.h"
#include "Logger.h"

#include <cerrno>
#include <climits>
#include <cstring>
#include <unistd.h>

namespace ConsoleGate {

namespace {
    const char* const COMPONENT = "Executor";
    const std::string DELETED_SUFFIX = " (deleted)";
}

Result<std::string> SelfExecutable::resolve() {
    char buf[PATH_MAX];
    ssize_t len = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len < 0) {
        auto err = Core::ErrorRegistry::createError(Core::ErrorCode::SELF_RESOLUTION_FAILED, COMPONENT);
        err.message += ": " + std::string(std::strerror(errno));
        return err;
    }
    buf[len] = '\0';

    std::string path(buf, static_cast<size_t>(len));
    if (path.size() > DELETED_SUFFIX.size() &&
        path.compare(path.size() - DELETED_SUFFIX.size(), DELETED_SUFFIX.size(), DELETED_SUFFIX) == 0) {
        auto err = Core::ErrorRegistry::createError(Core::ErrorCode::SELF_RESOLUTION_FAILED, COMPONENT);
        err.message += ": executable was replaced or deleted";
        return err;
    }

    return path;
}

Result<ExecutableTarget> SelfExecutable::selectTarget(const std::string& configuredPath,
                                                      bool allowPathFallback,
                                                      const std::string& fallbackName,
                                                      const Resolver& resolver) {
    if (!configuredPath.empty()) {
        return ExecutableTarget{configuredPath, false};
    }

    auto self = resolver();
    if (self.isOk()) {
        return ExecutableTarget{self.value(), false};
    }

    if (!allowPathFallback) {
        Logger::instance().error("Self-executable resolution failed and PATH fallback is disabled: " +
                                 self.error().message, COMPONENT);
        return self.error();
    }

    Logger::instance().warn("Self-executable resolution failed (" + self.error().message +
                            "); falling back to PATH lookup of '" + fallbackName + "'", COMPONENT);
    return ExecutableTarget{fallbackName, true};
}

} // namespace ConsoleGate
