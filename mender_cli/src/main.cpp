/**
 * @file main.cpp
 * @brief mender command line front end.
 */

#include <iostream>
#include <filesystem>
#include <csignal>
#include <algorithm>
#include <chrono>
#include <clocale>
#include <iomanip>
#include <mutex>
#include <stop_token>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libmender/include/errors.hpp"
#include "../../libmender/include/event_bus.hpp"
#include "../../libmender/include/events.hpp"
#include "../../libmender/include/recovery_pipeline.hpp"
#include "../../libmender/include/reports.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libmender/include/logger.hpp"
#include "utils/file_log_sink.hpp"

// simple progress bar printer
inline void print_progress_bar(const std::string_view label, const size_t done, const size_t total,
                               const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 55u ? term_width - 55u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r" << std::left << std::setw(12) << label << "[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::right << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace mender;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitInterrupted = 130; // standard exit code for SIGINT

volatile std::sig_atomic_t g_stop_signal = 0;

// handle ctrl+c or termination signals; the watcher thread does the rest
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_stop_signal = 1;
    }
}

void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// returns false if the log file could not be opened
bool install_log_sinks(const Settings& settings) {
    Logger::clear_sinks();

    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    LogLevel min_level = console_sink->log_level;
    Logger::add_sink(std::move(console_sink));

    if (!settings.log_file.empty()) {
        try {
            Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file, false));
            min_level = LogLevel::Debug;
        } catch (const std::runtime_error& e) {
            std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
            return false;
        }
    }
    Logger::set_min_level(min_level);
    return true;
}

fs::path reports_dir(const Settings& settings) {
    return settings.output_path / "reports";
}

int run_decide(const Settings& settings) {
    std::vector<CatalogEntry> entries;
    BatchStatistics stats;
    try {
        entries = load_catalog(settings.report_path);
        stats = statistics_from_catalog(entries);
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitUsage;
    }

    DecisionRecord record;
    try {
        const DecisionEngine engine(to_decision_config(settings));
        record.automatic = engine.decide(stats);
        if (const auto manual = to_manual_override(settings)) {
            record = apply_override(record.automatic, *manual);
        }
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitUsage;
    }

    const auto report = make_decision_report(record, stats);
    if (settings.dry_run) {
        std::cout << report.dump(2) << std::endl;
    } else {
        const fs::path dest = reports_dir(settings) / "decision_report.json";
        try {
            write_report(dest, report);
        } catch (const FatalPipelineError& e) {
            Logger::log(LogLevel::Error, e.what(), "main");
            return kExitFatal;
        }
        if (!settings.quiet) {
            std::cerr << "Decision report: " << dest.string() << "\n";
        }
    }

    if (!settings.quiet) {
        std::cerr << (record.effective_strategy() == Strategy::PerformRepair ? GREEN : YELLOW)
                  << "Decision: " << to_string(record.effective_strategy())
                  << RESET << "\n" << record.automatic.reasoning << std::endl;
    }
    return kExitOk;
}

std::vector<InputRecord> gather_inputs(const Settings& settings) {
    if (!settings.catalog_path.empty()) {
        std::vector<InputRecord> inputs;
        for (auto& entry : load_catalog(settings.catalog_path)) {
            inputs.push_back(std::move(entry.input));
        }
        return inputs;
    }
    const auto files = collect_input_files(settings.inputs, settings);
    return RecoveryPipeline::inputs_from_paths(files, settings.recovery_method);
}

// throws FatalPipelineError
void write_reports(const Settings& settings, const BatchResult& batch) {
    const fs::path dir = reports_dir(settings);
    write_report(dir / "validation_report.json", make_validation_report(batch));
    if (batch.decision) {
        write_report(dir / "decision_report.json", make_decision_report(*batch.decision, batch.statistics));
        write_report(dir / "repair_report.json", make_repair_report(batch));
    }
    if (!settings.quiet) {
        std::cerr << "Reports written to " << dir.string() << "\n";
    }
}

int run_batch(const Settings& settings) {
    std::vector<InputRecord> inputs;
    try {
        inputs = gather_inputs(settings);
    } catch (const std::runtime_error& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitUsage;
    }
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No valid input files.", "main");
        return kExitUsage;
    }

    PipelineOptions options;
    try {
        options = to_pipeline_options(settings);
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitUsage;
    }

    EventBus bus;
    std::mutex console_mtx;
    const size_t total = inputs.size();
    size_t classified = 0;
    const auto start_total = std::chrono::steady_clock::now();

    auto elapsed = [&start_total] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    };

    // handlers run on pool threads
    bus.subscribe<ArtifactClassifiedEvent>([&](const ArtifactClassifiedEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(console_mtx);
        if (e.record.classification != Classification::Valid) {
            std::cerr << (e.record.classification == Classification::Corrupted ? YELLOW : RED)
                      << "\r[" << to_string(e.record.classification) << "] " << e.id
                      << " (" << to_string(e.format) << ", " << to_string(e.record.type) << ")"
                      << RESET << "\033[K" << std::endl;
        }
        print_progress_bar("Classifying", ++classified, total, elapsed());
    });

    bus.subscribe<ArtifactSkippedEvent>([&](const ArtifactSkippedEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(console_mtx);
        std::cerr << CYAN << "\r[skipped] " << e.id << ": " << e.reason << RESET << "\033[K" << std::endl;
        print_progress_bar("Classifying", ++classified, total, elapsed());
    });

    bus.subscribe<BatchDecisionEvent>([&](const BatchDecisionEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(console_mtx);
        std::cerr << "\n" << (e.decision.effective_strategy() == Strategy::PerformRepair ? GREEN : YELLOW)
                  << "Decision: " << to_string(e.decision.effective_strategy())
                  << " (integrity score " << std::fixed << std::setprecision(1) << e.integrity_score << "%)"
                  << RESET << std::endl;
    });

    bus.subscribe<RepairCompleteEvent>([&](const RepairCompleteEvent& e) {
        if (settings.quiet) return;
        std::lock_guard lock(console_mtx);
        std::cerr << (e.status == RepairStatus::Repaired ? GREEN : RED)
                  << "\r[" << to_string(e.status) << "] " << e.id
                  << " -> " << to_string(e.final_classification)
                  << " (" << e.duration.count() << " ms)"
                  << RESET << "\033[K" << std::endl;
        print_progress_bar("Repairing", e.completed, e.total, elapsed());
    });

    RecoveryPipeline pipeline(std::move(options), bus);

    // polls the signal flag, request_stop() takes locks and is not signal safe
    std::jthread watcher([&pipeline](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (g_stop_signal) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for running tasks to finish..."
                          << RESET << std::endl;
                pipeline.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    BatchResult batch;
    try {
        batch = pipeline.run(inputs);
    } catch (const FatalPipelineError& e) {
        Logger::log(LogLevel::Error, std::string("Fatal: ") + e.what(), "main");
        return kExitFatal;
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return kExitUsage;
    }
    watcher.request_stop();

    const double total_seconds = elapsed();
    const auto rows = rows_from_batch(batch);

    if (!settings.quiet) {
        std::cerr << std::endl;
        print_console_report(rows, batch, settings.num_threads, total_seconds);
    }

    if (!settings.dry_run) {
        try {
            write_reports(settings, batch);
        } catch (const FatalPipelineError& e) {
            Logger::log(LogLevel::Error, std::string("Fatal: ") + e.what(), "main");
            return kExitFatal;
        }
    }

    // export CSV if requested
    if (!settings.csv_path.empty() && !export_csv_report(rows, batch, settings.csv_path, total_seconds)) {
        return kExitFatal;
    }

    if (batch.interrupted || g_stop_signal) {
        return kExitInterrupted;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"mender: integrity classification and repair of recovered images."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e) == 0 ? kExitOk : kExitUsage;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!install_log_sinks(settings)) {
        return kExitUsage;
    }
    init_utf8_locale();

    if (settings.command == Command::Decide) {
        return run_decide(settings);
    }
    return run_batch(settings);
}
