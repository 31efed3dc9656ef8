/**
 * @file file_scanner.cpp
 * @brief Input discovery with junk filtering and regex include / exclude.
 */

#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libmender/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db";
}

namespace {
std::vector<std::regex> compile_patterns(const std::vector<std::string>& patterns, const char* what) {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            Logger::log(LogLevel::Warning,
                        std::string("Invalid ") + what + " regex: " + pattern + " (" + e.what() + ")", "scanner");
        }
    }
    return compiled;
}

class PathFilter {
public:
    explicit PathFilter(const Settings& settings)
        : include_(compile_patterns(settings.include_patterns, "include")),
          exclude_(compile_patterns(settings.exclude_patterns, "exclude")),
          has_include_(!settings.include_patterns.empty()) {}

    [[nodiscard]] bool accepts(const fs::path& path) const {
        if (is_junk(path)) return false;

        const std::string path_str = path.string();
        for (const auto& re : exclude_) {
            if (std::regex_search(path_str, re)) return false;
        }
        if (!has_include_) return true;
        return std::ranges::any_of(include_, [&](const std::regex& re) {
            return std::regex_search(path_str, re);
        });
    }

private:
    std::vector<std::regex> include_;
    std::vector<std::regex> exclude_;
    bool has_include_;
};

template <class Iterator>
void collect_directory(const fs::path& dir, const PathFilter& filter, std::vector<fs::path>& result) {
    std::error_code ec;
    Iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Cannot read directory " + dir.string() + ": " + ec.message(), "scanner");
        return;
    }
    for (; it != Iterator(); it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory walk stopped in " + dir.string() + ": " + ec.message(), "scanner");
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && filter.accepts(it->path())) {
            result.push_back(it->path());
        }
    }
}
} // namespace


std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings) {
    std::vector<fs::path> result;
    const PathFilter filter(settings);

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            if (settings.recursive) {
                collect_directory<fs::recursive_directory_iterator>(in, filter, result);
            } else {
                collect_directory<fs::directory_iterator>(in, filter, result);
            }
        } else if (fs::is_regular_file(in, ec) && filter.accepts(in)) {
            result.push_back(in);
        }
    }

    std::ranges::sort(result);
    const auto dup = std::ranges::unique(result);
    result.erase(dup.begin(), dup.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
