#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace ConsoleGate {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...).
     * @return fallback when the name is not recognized
     */
    LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    const char* logLevelName(LogLevel level);

    /**
     * @brief Process-wide logger
     *
     * Entries look like `[2024-05-01 12:00:00] [WARN] [Executor] message`.
     * Console output is colored for WARN and above. When a log file is set,
     * every entry is also appended there and the file is rotated to
     * `<path>.<timestamp>` once it passes the size limit.
     *
     * Entries without a component are tagged "Console".
     */
    class Logger {
    public:
        static Logger& instance();

        /**
         * @brief Append to path from now on
         * @return false if the file could not be opened (console output continues)
         */
        bool setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        void writeToFile(const std::string& entry);
        std::string rotateLogFile();
        static std::string timestamp(const char* format);

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;
    };

}
