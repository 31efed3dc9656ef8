/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the engine logs through Logger with a component tag.
 * The library installs no sinks; front ends decide where messages go.
 */

#ifndef MENDER_LOGGER_HPP
#define MENDER_LOGGER_HPP

#include "log_sink.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for mender.
 *
 * Messages below the global minimum level are dropped before any sink is
 * locked, so Debug logging in hot loops costs one atomic load when disabled.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the global minimum level (default: Debug).
     */
    static void set_min_level(LogLevel level) noexcept;

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "mender").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "mender");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a level name to LogLevel. Case-insensitive.
     * Accepts "WARN" and "WARNING". Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(std::string level) {
        std::ranges::transform(level, level.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
    static std::atomic<LogLevel> min_level_;
};

#endif //MENDER_LOGGER_HPP
