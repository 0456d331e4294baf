#pragma once

#include <functional>
#include <string>
#include <mutex>
#include <sstream>
#include <utility>

namespace coach {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe console Logger.
 * Messages below the configured minimum level are dropped before formatting.
 * A sink replaces the console output (tests capture warnings this way).
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void log(LogLevel level, const std::string& message);

    static void setLevel(LogLevel level);
    [[nodiscard]] static LogLevel getLevel();
    [[nodiscard]] static bool isEnabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(getLevel());
    }

    /**
     * Route every line to sink instead of stdout. An empty sink restores the console.
     */
    static void setSink(Sink sink);

    /**
     * Parses "debug", "info", "warn" or "error". Unknown names map to INFO.
     */
    [[nodiscard]] static LogLevel parseLevel(const std::string& name);

    template<typename... Args>
    static void debug(Args... args) {
        if (!isEnabled(LogLevel::DEBUG)) return;
        log(LogLevel::DEBUG, format(args...));
    }

    template<typename... Args>
    static void info(Args... args) {
        if (!isEnabled(LogLevel::INFO)) return;
        log(LogLevel::INFO, format(args...));
    }

    template<typename... Args>
    static void warn(Args... args) {
        if (!isEnabled(LogLevel::WARN)) return;
        log(LogLevel::WARN, format(args...));
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, format(args...));
    }

private:
    template<typename... Args>
    static std::string format(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    static std::mutex mutex_;
    static LogLevel level_;
    static Sink sink_;
};

/**
 * Logger bound to a component. Every line reads "Component: message".
 */
class LogChannel {
public:
    explicit LogChannel(std::string component) : component_(std::move(component)) {}

    template<typename... Args>
    void debug(Args... args) const { Logger::debug(component_, ": ", args...); }

    template<typename... Args>
    void info(Args... args) const { Logger::info(component_, ": ", args...); }

    template<typename... Args>
    void warn(Args... args) const { Logger::warn(component_, ": ", args...); }

    template<typename... Args>
    void error(Args... args) const { Logger::error(component_, ": ", args...); }

    [[nodiscard]] const std::string& getComponent() const { return component_; }

private:
    std::string component_;
};

} // namespace coach
