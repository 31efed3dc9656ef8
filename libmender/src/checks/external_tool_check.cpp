/**
 * @file external_tool_check.cpp
 * @brief Forensic command-line checkers (jpeginfo, pngcheck, identify).
 */

#include "../../include/builtin_checks.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/subprocess.hpp"
#include <algorithm>

namespace mender {

    namespace {

        // removes the temporary copy however the check ends
        struct ScopedTempDir {
            std::filesystem::path dir;
            ~ScopedTempDir() { cleanup_temp_dir(dir, "oracle"); }
        };

        std::string summarize_output(const std::string& output) {
            std::string line;
            for (const char c : output) {
                if (c == '\n' || c == '\r') {
                    if (!line.empty()) break;
                    continue;
                }
                line += c;
            }
            constexpr std::size_t kMaxLen = 200;
            if (line.size() > kMaxLen) line.resize(kMaxLen);
            return line;
        }

    } // namespace

    ExternalToolCheck::ExternalToolCheck(std::string name,
                                         std::string program,
                                         std::vector<std::string> args,
                                         std::vector<ImageFormat> formats,
                                         const std::chrono::milliseconds timeout)
        : name_(std::move(name)),
          executable_(find_executable(program)),
          args_(std::move(args)),
          formats_(std::move(formats)),
          timeout_(timeout) {
        if (executable_.empty()) {
            Logger::log(LogLevel::Debug, program + " not found on PATH, " + name_ + " disabled", "oracle");
        }
    }

    bool ExternalToolCheck::supports(const ImageFormat format) const noexcept {
        return std::ranges::find(formats_, format) != formats_.end();
    }

    ValidationVerdict ExternalToolCheck::check(const CheckContext& ctx) const {
        if (executable_.empty()) {
            throw CheckUnavailable(name_ + ": executable not found");
        }

        const auto& artifact = ctx.artifact;
        const std::filesystem::path hint = artifact.provenance().source_path.empty()
                                               ? std::filesystem::path(artifact.id())
                                               : artifact.provenance().source_path;
        const ScopedTempDir tmp{make_temp_dir_for(hint, name_)};
        const auto copy = tmp.dir / (artifact.format() == ImageFormat::Png ? "artifact.png" : "artifact.jpg");
        try {
            write_file_atomic(copy, artifact.bytes());
        } catch (const FatalPipelineError& e) {
            throw CheckUnavailable(name_ + ": " + e.what());
        }

        std::vector<std::string> argv;
        argv.reserve(args_.size() + 2);
        argv.push_back(executable_.string());
        argv.insert(argv.end(), args_.begin(), args_.end());
        argv.push_back(copy.string());

        const ProcessResult result = run_process(argv, timeout_);
        if (result.timed_out) {
            throw CheckUnavailable(name_ + ": timed out after " + std::to_string(timeout_.count()) + " ms");
        }
        if (result.exit_code == kExecFailedStatus) {
            throw CheckUnavailable(name_ + ": could not execute " + executable_.string());
        }
        if (result.exit_code == 0) {
            return pass();
        }

        std::string summary = summarize_output(result.output);
        if (summary.empty()) {
            summary = "exit status " + std::to_string(result.exit_code);
        }
        return fail(std::move(summary));
    }

} // namespace mender
