#include "../../include/subprocess.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace mender {

#ifdef _WIN32

    ProcessResult run_process(const std::vector<std::string>&, std::chrono::milliseconds, std::size_t) {
        throw std::runtime_error("external tools are not supported on this platform");
    }

    std::filesystem::path find_executable(std::string_view) {
        return {};
    }

#else

    namespace {

        int decode_status(const int status) {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return -1;
        }

        bool is_executable_file(const std::filesystem::path& p) {
            std::error_code ec;
            return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
        }

    } // namespace

    ProcessResult run_process(const std::vector<std::string>& argv,
                              const std::chrono::milliseconds timeout,
                              const std::size_t max_output) {
        if (argv.empty()) {
            throw std::invalid_argument("run_process: empty argument list");
        }

        // everything the child touches is prepared before fork
        std::vector<char*> cargs;
        cargs.reserve(argv.size() + 1);
        for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
        cargs.push_back(nullptr);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
        }

        if (pid == 0) {
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
            if (const int devnull = ::open("/dev/null", O_RDONLY); devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::execv(cargs[0], cargs.data());
            ::_exit(kExecFailedStatus);
        }

        ::close(fds[1]);

        ProcessResult result;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        char buf[4096];

        for (;;) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            pollfd pfd{fds[0], POLLIN, 0};
            const int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (rc < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (rc == 0) {
                result.timed_out = true;
                break;
            }
            const ssize_t got = ::read(fds[0], buf, sizeof(buf));
            if (got > 0) {
                if (result.output.size() < max_output) {
                    result.output.append(buf, std::min(static_cast<std::size_t>(got),
                                                       max_output - result.output.size()));
                }
                continue;
            }
            if (got < 0 && errno == EINTR) continue;
            break; // EOF or read error
        }
        ::close(fds[0]);

        if (result.timed_out) {
            ::kill(pid, SIGKILL);
        }

        // the child may outlive its output pipe, so the wait is bounded too
        int status = 0;
        for (;;) {
            const pid_t w = ::waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
            if (w == pid) break;
            if (w < 0) {
                if (errno == EINTR) continue;
                Logger::log(LogLevel::Warning, std::string("waitpid failed: ") + std::strerror(errno), "subprocess");
                return result;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                ::kill(pid, SIGKILL);
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        if (!result.timed_out) {
            result.exit_code = decode_status(status);
        }
        Logger::log(LogLevel::Debug,
                    argv[0] + (result.timed_out ? std::string(" timed out") :
                                                  " exited with " + std::to_string(result.exit_code)),
                    "subprocess");
        return result;
    }

    std::filesystem::path find_executable(const std::string_view program) {
        if (program.empty()) return {};
        if (program.find('/') != std::string_view::npos) {
            const std::filesystem::path p(program);
            return is_executable_file(p) ? std::filesystem::absolute(p) : std::filesystem::path{};
        }

        const char* env = std::getenv("PATH");
        const std::string path_var = env ? env : "/usr/local/bin:/usr/bin:/bin";
        std::size_t start = 0;
        while (start <= path_var.size()) {
            const std::size_t end = std::min(path_var.find(':', start), path_var.size());
            const std::string dir = path_var.substr(start, end - start);
            const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : dir) / program;
            if (is_executable_file(candidate)) {
                return std::filesystem::absolute(candidate);
            }
            start = end + 1;
        }
        return {};
    }

#endif

} // namespace mender
