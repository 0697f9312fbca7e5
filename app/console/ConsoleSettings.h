#pragma once

#include <string>
#include <vector>

#include "Config.h"
#include "Result.h"

namespace ConsoleGate {

/**
 * @brief Effective runtime settings for the console daemon
 *
 * Built from a Config (file values or defaults); command-line flags are
 * written into the same Config before fromConfig() runs so they win.
 */
struct ConsoleSettings {
    std::string listenAddress{"127.0.0.1"};
    int port{7363};
    int execTimeoutSeconds{30};
    bool demoMode{false};
    std::string trustedBinary;      // empty: execute ourselves
    bool pathFallback{true};
    size_t maxRequestBytes{1024 * 1024};
    std::string logLevel{"INFO"};
    std::string logFile;

    static ConsoleSettings fromConfig(const Config& config);

    // Keys fromConfig() reads; anything else in console.conf is a typo.
    static const std::vector<std::string>& knownKeys();

    VoidResult validate() const;

    /**
     * @brief Contents of a freshly written console.conf
     */
    static std::string configTemplate();
};

} // namespace ConsoleGate
