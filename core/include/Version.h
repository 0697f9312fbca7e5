#pragma once

#include <string>

namespace ConsoleGate {
namespace Version {

    constexpr const char* STRING = "1.0.0";

    // Name used for the PATH fallback and the XDG config/data directories.
    constexpr const char* BINARY_NAME = "consolegate";

    inline std::string toString() {
        return STRING;
    }

} // namespace Version
} // namespace ConsoleGate
