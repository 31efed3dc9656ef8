/**
 * @file console_log_sink.hpp
 * @brief Log sink writing to the terminal.
 */

#ifndef MENDER_CONSOLE_LOG_SINK_HPP
#define MENDER_CONSOLE_LOG_SINK_HPP

#include "../../../libmender/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above log_level. Info and Debug go to
 * stdout, warnings and errors to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // MENDER_CONSOLE_LOG_SINK_HPP
