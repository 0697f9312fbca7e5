#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ConsoleGate {

    namespace {
        const char* const DEFAULT_COMPONENT = "Console";
        const char* const RED = "\033[1;31m";
        const char* const YELLOW = "\033[1;33m";
        const char* const RESET = "\033[0m";
    }

    LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "CRITICAL") return LogLevel::CRITICAL;
        return fallback;
    }

    const char* logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    bool Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        logFile_.open(path, std::ios::app);

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
        return logFile_.is_open();
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileSizeMB_ = maxSizeMB;
    }

    void Logger::setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_) {
            return;
        }

        std::string entry = "[" + timestamp("%Y-%m-%d %H:%M:%S") + "] [" + logLevelName(level) + "] [" +
                            (component.empty() ? DEFAULT_COMPONENT : component) + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (consoleOutput_) {
            if (level >= LogLevel::ERROR) {
                std::cerr << RED << entry << RESET << std::endl;
            } else if (level == LogLevel::WARN) {
                std::cout << YELLOW << entry << RESET << std::endl;
            } else {
                std::cout << entry << std::endl;
            }
        }
        writeToFile(entry);
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    // Called with mutex_ held.
    void Logger::writeToFile(const std::string& entry) {
        if (!logFile_.is_open()) {
            return;
        }

        logFile_ << entry << '\n';
        logFile_.flush();
        currentFileSize_ += entry.size() + 1;

        if (currentFileSize_ <= maxFileSizeMB_ * 1024 * 1024) {
            return;
        }

        std::string rotatedPath = rotateLogFile();
        if (!rotatedPath.empty() && logFile_.is_open()) {
            std::string note = "[" + timestamp("%Y-%m-%d %H:%M:%S") + "] [INFO] [Logger] Log file rotated to: " +
                               rotatedPath;
            logFile_ << note << '\n';
            currentFileSize_ = note.size() + 1;
        }
    }

    // Called with mutex_ held; returns the rotated path or "" on failure.
    std::string Logger::rotateLogFile() {
        if (logFilePath_.empty()) {
            return "";
        }

        logFile_.close();
        std::string rotatedPath = logFilePath_ + "." + timestamp("%Y%m%d_%H%M%S");

        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            rotatedPath.clear();
        }

        logFile_.open(logFilePath_, std::ios::app);
        currentFileSize_ = 0;
        return rotatedPath;
    }

    std::string Logger::timestamp(const char* format) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm tm_buf;
        localtime_r(&now, &tm_buf);
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, format);
        return ss.str();
    }

}
