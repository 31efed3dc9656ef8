/**
 * @file report_generator.cpp
 * @brief Console table and CSV summary of a batch.
 */

#include "report_generator.hpp"
#include "../../../libmender/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <regex>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

using namespace mender;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string percent(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

static std::string colorize(const std::string& result, const bool use_colors) {
    if (!use_colors) return result;
    if (result == "ok" || result == "repaired") return "\033[1;32m" + result + "\033[0m";
    if (result == "failed" || result == "rejected") return "\033[1;31m" + result + "\033[0m";
    return "\033[1;33m" + result + "\033[0m";
}

std::vector<ArtifactRow> rows_from_batch(const BatchResult& batch) {
    std::map<std::string_view, const RepairResult*> repairs;
    for (const auto& r : batch.repairs) {
        repairs.emplace(r.outcome.artifact_id, &r);
    }
    std::map<std::string_view, const SkippedInput*> not_repaired;
    for (const auto& s : batch.repair_skipped) {
        not_repaired.emplace(s.id, &s);
    }

    std::vector<ArtifactRow> rows;
    rows.reserve(batch.artifacts.size() + batch.skipped.size());

    for (const auto& a : batch.artifacts) {
        ArtifactRow row;
        row.id = a.artifact.id();
        row.path = a.artifact.provenance().source_path;
        row.format = std::string(to_string(a.artifact.format()));
        row.classification = std::string(to_string(a.record.classification));
        row.type = std::string(to_string(a.record.type));
        row.tier = a.record.tier;
        row.technique = a.record.technique ? std::string(to_string(*a.record.technique)) : "-";

        if (a.record.classification == Classification::Valid) {
            row.result = "ok";
        } else if (const auto it = repairs.find(row.id); it != repairs.end()) {
            const auto& outcome = it->second->outcome;
            row.result = std::string(to_string(outcome.status));
            if (const auto used = outcome.technique_used()) {
                row.technique = std::string(to_string(*used));
            }
            row.detail = it->second->output_path ? it->second->output_path->string() : outcome.diagnostic;
        } else if (const auto sk = not_repaired.find(row.id); sk != not_repaired.end()) {
            row.result = "skipped";
            row.detail = sk->second->reason;
        } else {
            row.result = a.record.classification == Classification::Corrupted ? "pending" : "rejected";
        }
        rows.push_back(std::move(row));
    }

    for (const auto& s : batch.skipped) {
        ArtifactRow row;
        row.id = s.id;
        row.path = s.path;
        row.format = "-";
        row.classification = "-";
        row.type = "-";
        row.technique = "-";
        row.result = "skipped";
        row.detail = s.reason;
        rows.push_back(std::move(row));
    }
    return rows;
}

void print_console_report(const std::vector<ArtifactRow>& rows,
                          const BatchResult& batch,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_format = 8;
    size_t max_class = 16;
    size_t max_type = 16;
    size_t max_tier = 6;
    size_t max_technique = 11;
    size_t max_result = 10;
    #ifdef max
    #undef max
    #endif
    for (const auto& r : rows) {
        max_format    = std::max(max_format, r.format.size() + 2);
        max_class     = std::max(max_class, r.classification.size() + 2);
        max_type      = std::max(max_type, r.type.size() + 2);
        max_technique = std::max(max_technique, r.technique.size() + 2);
        max_result    = std::max(max_result, r.result.size() + 2);
    }

    const unsigned fixed_cols_width = max_format + max_class + max_type + max_tier + max_technique + max_result;
    const unsigned id_col_width = term_width > fixed_cols_width + 30
                                ? std::min(40u, term_width - fixed_cols_width - 20)
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(id_col_width) << "Artifact"
              << std::setw(max_format)    << "Format"
              << std::setw(max_class)     << "Classification"
              << std::setw(max_type)      << "Type"
              << std::setw(max_tier)      << "Tier"
              << std::setw(max_technique) << "Technique"
              << std::setw(max_result)    << "Result"
              << "Detail"
              << "\n";

    for (const auto& r : rows) {
        const std::string outcome = colorize(r.result, use_colors);
        // setw counts escape bytes, pad by the visible width instead
        const size_t pad = max_result > strip_ansi(outcome).size() ? max_result - strip_ansi(outcome).size() : 1;
        std::cerr << std::left << std::setw(id_col_width) << truncate(r.id, id_col_width)
                  << std::setw(max_format)    << r.format
                  << std::setw(max_class)     << r.classification
                  << std::setw(max_type)      << r.type
                  << std::setw(max_tier)      << (r.tier > 0 ? std::to_string(r.tier) : "-")
                  << std::setw(max_technique) << r.technique
                  << outcome << std::string(pad, ' ')
                  << r.detail
                  << "\n";
    }

    const auto& stats = batch.statistics;
    std::cerr << "\nArtifacts: " << stats.total
              << " (valid " << stats.valid
              << ", corrupted " << stats.corrupted
              << ", unrecoverable " << stats.unrecoverable
              << ", skipped " << batch.skipped.size() << ")\n";
    std::cerr << "Integrity score: " << percent(stats.integrity_score()) << "\n";

    if (batch.decision) {
        const auto& d = batch.decision->automatic;
        std::cerr << "Decision: " << to_string(d.strategy)
                  << " (rule R" << d.rule << ", confidence " << to_string(d.confidence)
                  << ", estimate " << percent(d.estimate) << ")\n";
        if (batch.decision->override_) {
            std::cerr << "Manual override: " << to_string(batch.decision->override_->strategy)
                      << " approved by " << batch.decision->override_->approver << "\n";
        }

        const auto repaired = std::ranges::count_if(batch.repairs, [](const RepairResult& r) {
            return r.outcome.status == RepairStatus::Repaired;
        });
        const auto counts = batch.final_counts();
        std::cerr << "Repaired: " << repaired << "/" << batch.repairs.size() << "\n";
        std::cerr << "Final counts: valid " << counts.valid
                  << ", corrupted " << counts.corrupted
                  << ", unrecoverable " << counts.unrecoverable << "\n";
    }

    if (batch.interrupted) {
        std::cerr << "Batch interrupted before completion.\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<ArtifactRow>& rows,
                       const BatchResult& batch,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write CSV report: " + output_path.string(), "report");
        return false;
    }

    out << "Artifact,Path,Format,Classification,Type,Tier,Technique,Result,Detail\n";
    for (const auto& r : rows) {
        out << csv_escape(r.id) << ","
            << csv_escape(r.path.string()) << ","
            << csv_escape(r.format) << ","
            << csv_escape(r.classification) << ","
            << csv_escape(r.type) << ","
            << r.tier << ","
            << csv_escape(r.technique) << ","
            << csv_escape(r.result) << ","
            << csv_escape(r.detail) << "\n";
    }

    const auto& stats = batch.statistics;
    out << "\n\nTotal,Valid,Corrupted,Unrecoverable,Skipped,Integrity score(%)\n";
    out << stats.total << "," << stats.valid << "," << stats.corrupted << ","
        << stats.unrecoverable << "," << batch.skipped.size() << ","
        << std::fixed << std::setprecision(2) << stats.integrity_score() << "\n";

    if (batch.decision) {
        const auto counts = batch.final_counts();
        out << "\n\nStrategy,Rule,Confidence,Estimate(%),Final valid,Final corrupted,Final unrecoverable\n";
        out << to_string(batch.decision->effective_strategy()) << ","
            << "R" << batch.decision->automatic.rule << ","
            << to_string(batch.decision->automatic.confidence) << ","
            << std::fixed << std::setprecision(2) << batch.decision->automatic.estimate << ","
            << counts.valid << "," << counts.corrupted << "," << counts.unrecoverable << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::fixed << std::setprecision(2) << total_seconds << " seconds\n";

    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Failed writing CSV report: " + output_path.string(), "report");
        return false;
    }
    return true;
}
