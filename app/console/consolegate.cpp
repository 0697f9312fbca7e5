#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "CommandAllowlist.h"
#include "CommandRunner.h"
#include "Config.h"
#include "ConsoleServer.h"
#include "ConsoleSettings.h"
#include "ExecEndpoint.h"
#include "Logger.h"
#include "PathUtils.h"
#include "Version.h"

using namespace ConsoleGate;

namespace {

    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    void printUsage(const char* argv0) {
        std::cout << "ConsoleGate - local web console for an allowlisted CLI" << std::endl;
        std::cout << "\nUsage: " << argv0 << " [serve|version] [OPTIONS]" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <PATH>            Configuration file (default: ~/.config/consolegate/console.conf)" << std::endl;
        std::cout << "  --address <IP>             Listen address (default: 127.0.0.1)" << std::endl;
        std::cout << "  --port <PORT>              Listen port (default: 7363)" << std::endl;
        std::cout << "  --timeout <SECONDS>        Per-command time limit (default: 30)" << std::endl;
        std::cout << "  --demo                     Serve canned output instead of running commands" << std::endl;
        std::cout << "  --no-path-fallback         Fail instead of searching PATH when the binary cannot be resolved" << std::endl;
        std::cout << "  --log-level <LEVEL>        DEBUG, INFO, WARN, ERROR or CRITICAL (default: INFO)" << std::endl;
        std::cout << "  --help                     Show this help message" << std::endl;
    }

    // Flags that take a value, mapped to their config key.
    const char* valueFlagKey(const std::string& flag) {
        if (flag == "--address") return "listen_address";
        if (flag == "--port") return "port";
        if (flag == "--timeout") return "exec_timeout_seconds";
        if (flag == "--log-level") return "log_level";
        return nullptr;
    }

    bool loadConfiguration(Config& config, const std::string& explicitPath) {
        if (!explicitPath.empty()) {
            if (!config.loadFromFile(explicitPath)) {
                std::cerr << "Failed to load config file: " << explicitPath << std::endl;
                return false;
            }
            return true;
        }

        std::filesystem::path configPath;
        try {
            configPath = PathUtils::getConfigPath();
            if (config.loadFromFile(configPath.string())) {
                return true;
            }
            // First start: write a template so the available keys are discoverable.
            PathUtils::ensureDirectory(configPath.parent_path());
        } catch (const std::runtime_error& e) {
            std::cerr << "Using built-in defaults: " << e.what() << std::endl;
            return true;
        }
        std::ofstream templateFile(configPath);
        if (templateFile.is_open()) {
            templateFile << ConsoleSettings::configTemplate();
        }
        return true;
    }

    void setupLogging(const ConsoleSettings& settings) {
        auto& logger = Logger::instance();
        logger.setLevel(parseLogLevel(settings.logLevel));
        logger.setMaxFileSize(100);

        try {
            std::filesystem::path logPath = settings.logFile.empty()
                ? PathUtils::getLogPath()
                : std::filesystem::path(settings.logFile);
            PathUtils::ensureDirectory(logPath.parent_path());
            if (!logger.setLogFile(logPath.string())) {
                logger.warn("Cannot open log file " + logPath.string() + "; logging to console only", "Console");
            }
        } catch (const std::runtime_error& e) {
            logger.warn(std::string("Logging to console only: ") + e.what(), "Console");
        }
    }

    int serve(const ConsoleSettings& settings) {
        auto& logger = Logger::instance();
        logger.info("=== ConsoleGate " + Version::toString() + " starting ===", "Console");
        logger.info(std::string("Log level ") + logLevelName(logger.getLevel()), "Console");

        std::unique_ptr<ICommandRunner> runner;
        if (settings.demoMode) {
            runner = std::make_unique<DemoCommandRunner>();
            logger.warn("Demo mode: commands are answered with sample output and never executed", "Console");
        } else {
            RunnerOptions options;
            options.trustedBinary = settings.trustedBinary;
            options.pathFallback = settings.pathFallback;
            options.fallbackName = Version::BINARY_NAME;
            options.timeout = std::chrono::seconds(settings.execTimeoutSeconds);

            try {
                runner = std::make_unique<SandboxedCommandRunner>(CommandAllowlist::defaults(), options);
            } catch (const std::invalid_argument& e) {
                logger.critical(std::string("Built-in allowlist is invalid: ") + e.what(), "Console");
                return 1;
            }
            logger.info("Allowlist loaded with " + std::to_string(CommandAllowlist::defaults().size()) +
                        " entries; trusted binary: " +
                        (settings.trustedBinary.empty() ? std::string("<self>") : settings.trustedBinary),
                        "Console");
        }

        ExecEndpoint endpoint(*runner);

        ConsoleServerOptions serverOptions;
        serverOptions.address = settings.listenAddress;
        serverOptions.port = settings.port;
        serverOptions.maxRequestBytes = settings.maxRequestBytes;

        ConsoleServer server(serverOptions, endpoint);
        if (!server.start()) {
            logger.critical("Failed to start console server", "Console");
            return 1;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        while (!signalReceived && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (signalReceived) {
            int sigNum = receivedSignalNum;
            logger.info("Received signal " + std::to_string(sigNum) + ", shutting down", "Console");
        }

        server.stop();
        logger.info("=== ConsoleGate stopped ===", "Console");
        return 0;
    }

}

int main(int argc, char* argv[]) {
    int firstOption = 1;
    std::string subcommand = "serve";
    if (argc > 1 && argv[1][0] != '-') {
        subcommand = argv[1];
        firstOption = 2;
    }

    if (subcommand == "version") {
        std::cout << Version::BINARY_NAME << " version " << Version::toString() << std::endl;
        return 0;
    }
    if (subcommand != "serve") {
        std::cerr << "unknown command \"" << subcommand << "\"" << std::endl;
        return 2;
    }

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = firstOption; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--demo") {
            overrides.emplace_back("demo_mode", "true");
        }
        else if (arg == "--no-path-fallback") {
            overrides.emplace_back("path_fallback", "false");
        }
        else if (const char* key = valueFlagKey(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            overrides.emplace_back(key, argv[++i]);
        }
        else {
            std::cerr << "Unknown option: " << arg << " (see --help)" << std::endl;
            return 2;
        }
    }

    Config config;
    if (!loadConfiguration(config, configPath)) {
        return 1;
    }
    config.applyOverrides(overrides);

    ConsoleSettings settings = ConsoleSettings::fromConfig(config);
    setupLogging(settings);

    for (const auto& key : config.unknownKeys(ConsoleSettings::knownKeys())) {
        Logger::instance().warn("Ignoring unknown config key '" + key + "'", "Settings");
    }
    if (config.skippedLines() > 0) {
        Logger::instance().warn("Skipped " + std::to_string(config.skippedLines()) +
                                " malformed config line(s)", "Settings");
    }

    auto valid = settings.validate();
    if (!valid) {
        Logger::instance().error(valid.error().toString(), "Console");
        return 1;
    }

    return serve(settings);
}
