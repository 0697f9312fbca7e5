#pragma once

#include <filesystem>

namespace ConsoleGate {

/**
 * @brief XDG locations of the console's own files
 *
 * Getters throw std::runtime_error when neither the XDG variable nor HOME
 * is set.
 */
class PathUtils {
public:
    // $XDG_CONFIG_HOME/consolegate/console.conf
    static std::filesystem::path getConfigPath();

    // $XDG_DATA_HOME/consolegate/logs/consolegate.log
    static std::filesystem::path getLogPath();

    static void ensureDirectory(const std::filesystem::path& dir);

private:
    static std::filesystem::path xdgDir(const char* variable, const char* homeRelative);
};

} // namespace ConsoleGate
