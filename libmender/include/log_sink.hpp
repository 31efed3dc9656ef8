#ifndef MENDER_LOG_SINK_HPP
#define MENDER_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-check and per-segment diagnostics
    Info,    ///< Batch progress and decisions
    Warning, ///< Degraded checks, library warnings
    Error    ///< Failures that affect an artifact or the batch
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). The Logger
 * facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // MENDER_LOG_SINK_HPP
