#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <cstring>
#include <memory>
#include <random>
#include <stdexcept>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace mender {

    namespace {

        struct FileCloser {
            void operator()(FILE* f) const noexcept {
                if (f) std::fclose(f);
            }
        };
        using unique_file = std::unique_ptr<FILE, FileCloser>;

        std::mt19937_64& thread_rng() {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            return rng;
        }

    } // namespace

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        const auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        // long path prefix bypasses MAX_PATH
        const std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path) {
        const unique_file f(open_file(path, "rb"));
        if (!f) {
            throw std::runtime_error("cannot open " + path.string() + ": " + std::strerror(errno));
        }

        std::vector<std::uint8_t> data;
        std::uint8_t buf[1 << 16];
        std::size_t got;
        while ((got = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
            data.insert(data.end(), buf, buf + got);
        }
        if (std::ferror(f.get())) {
            throw std::runtime_error("read error on " + path.string());
        }
        return data;
    }

    void write_file_atomic(const std::filesystem::path& dest, const std::span<const std::uint8_t> bytes) {
        const auto dir = dest.parent_path();
        std::error_code ec;
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw FatalPipelineError("cannot create " + dir.string() + ": " + ec.message());
            }
        }

        const auto tmp = dir / ("." + dest.filename().string() + ".tmp-" + random_suffix());
        {
            unique_file f(open_file(tmp, "wb"));
            if (!f) {
                throw FatalPipelineError("cannot create " + tmp.string() + ": " + std::strerror(errno));
            }
            bool ok = bytes.empty() || std::fwrite(bytes.data(), 1, bytes.size(), f.get()) == bytes.size();
            ok = ok && std::fflush(f.get()) == 0;
#ifndef _WIN32
            ok = ok && ::fsync(::fileno(f.get())) == 0;
#endif
            if (ok) {
                ok = std::fclose(f.release()) == 0;
            }
            if (!ok) {
                f.reset();
                std::filesystem::remove(tmp, ec);
                throw FatalPipelineError("write failed for " + dest.string());
            }
        }

        std::filesystem::rename(tmp, dest, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw FatalPipelineError("cannot move output into place at " + dest.string() + ": " + ec.message());
        }
    }

    std::filesystem::path unique_destination(const std::filesystem::path& dir, const std::string& filename) {
        const std::filesystem::path name(filename);
        const std::string stem = name.stem().string();
        const std::string ext = name.extension().string();

        std::error_code ec;
        auto candidate = dir / name;
        for (int n = 1; std::filesystem::exists(candidate, ec); ++n) {
            candidate = dir / (stem + "_" + std::to_string(n) + ext);
        }
        return candidate;
    }

    std::string random_suffix(const std::size_t length) {
        static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
        std::uniform_int_distribution<std::size_t> dist(0, sizeof(kAlphabet) - 2);
        std::string out;
        out.reserve(length);
        for (std::size_t i = 0; i < length; ++i) {
            out += kAlphabet[dist(thread_rng())];
        }
        return out;
    }

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path, const std::string& prefix) {
        std::error_code ec;
        const auto base_tmp = std::filesystem::temp_directory_path(ec) / ("mender-" + prefix);
        std::filesystem::create_directories(base_tmp, ec);

        auto dir = base_tmp / (prefix + "_" + input_path.stem().string() + "_" + random_suffix());
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                        "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                        "file_utils");
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace mender
