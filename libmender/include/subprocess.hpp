/**
 * @file subprocess.hpp
 * @brief Bounded execution of external command-line tools.
 */

#ifndef MENDER_SUBPROCESS_HPP
#define MENDER_SUBPROCESS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

    /// Exit status reported when the child could not exec the program.
    inline constexpr int kExecFailedStatus = 127;

    struct ProcessResult {
        int exit_code = -1;    ///< Exit status, or 128 + signal number
        std::string output;    ///< Combined stdout and stderr, capped
        bool timed_out = false;
    };

    /**
     * @brief Run argv[0] with the given arguments and wait for it.
     *
     * stdin is /dev/null; stdout and stderr are captured together. The child
     * is killed once @p timeout elapses.
     *
     * @param argv Absolute program path followed by its arguments.
     * @throws std::invalid_argument if argv is empty.
     * @throws std::runtime_error if the process could not be started.
     */
    [[nodiscard]] ProcessResult run_process(const std::vector<std::string>& argv,
                                            std::chrono::milliseconds timeout,
                                            std::size_t max_output = 64 * 1024);

    /**
     * @brief Resolve a program name against PATH.
     * @return Absolute path of an executable file, or an empty path.
     */
    [[nodiscard]] std::filesystem::path find_executable(std::string_view program);

} // namespace mender

#endif // MENDER_SUBPROCESS_HPP
