#include "PathUtils.h"
#include "Version.h"

#include <cstdlib>
#include <stdexcept>

namespace ConsoleGate {

std::filesystem::path PathUtils::xdgDir(const char* variable, const char* homeRelative) {
    const char* base = std::getenv(variable);
    if (base && base[0] == '/') {
        return std::filesystem::path(base) / Version::BINARY_NAME;
    }
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        throw std::runtime_error(std::string("neither ") + variable + " nor HOME is set");
    }
    return std::filesystem::path(home) / homeRelative / Version::BINARY_NAME;
}

std::filesystem::path PathUtils::getConfigPath() {
    return xdgDir("XDG_CONFIG_HOME", ".config") / "console.conf";
}

std::filesystem::path PathUtils::getLogPath() {
    return xdgDir("XDG_DATA_HOME", ".local/share") / "logs" / (std::string(Version::BINARY_NAME) + ".log");
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace ConsoleGate
