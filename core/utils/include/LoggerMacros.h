/**
 * @file LoggerMacros.h
 * @brief Debug-level logging helpers for the request path
 *
 * The message expression is only evaluated when DEBUG is enabled, so
 * argv dumps and timing strings cost nothing at the default INFO level.
 *
 *   LOG_DEBUG_COMP_IF("Spawning " + binary, "Executor");
 *   SCOPED_TIMER_COMP("exec '" + base + "'", "Executor");
 */

#pragma once

#include "Logger.h"

#include <chrono>
#include <utility>
#include <string>

namespace ConsoleGate {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ConsoleGate::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

/**
 * @brief Logs "<label> took Nms" at DEBUG when it goes out of scope
 *
 * The label is only kept when DEBUG is on at construction.
 */
class ScopedTimer {
public:
    ScopedTimer(std::string label, std::string component)
        : enabled_(Logger::instance().isDebugEnabled()),
          start_(std::chrono::steady_clock::now()) {
        if (enabled_) {
            label_ = std::move(label);
            component_ = std::move(component);
        }
    }

    ~ScopedTimer() {
        if (!enabled_) return;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
        Logger::instance().debug(label_ + " took " + std::to_string(elapsed) + "ms", component_);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    bool enabled_;
    std::chrono::steady_clock::time_point start_;
    std::string label_;
    std::string component_;
};

#define SCOPED_TIMER_COMP(label, component) ::ConsoleGate::ScopedTimer timer__(label, component)

} // namespace ConsoleGate
