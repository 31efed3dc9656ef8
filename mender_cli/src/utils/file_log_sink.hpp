/**
 * @file file_log_sink.hpp
 * @brief Log sink appending to a file (--log-file).
 */

#ifndef MENDER_FILE_LOG_SINK_HPP
#define MENDER_FILE_LOG_SINK_HPP

#include "../../../libmender/include/log_sink.hpp"
#include "../../../libmender/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

class FileLogSink final : public ILogSink {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {
        if (!out_.is_open()) {
            throw std::runtime_error("cannot open log file: " + filename.string());
        }
    }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        std::lock_guard lock(mtx_);
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // MENDER_FILE_LOG_SINK_HPP
