/**
 * @file cli_parser.cpp
 * @brief CLI11 wiring for the run, validate and decide subcommands.
 */

#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {
// helper for validating TYPE=PERCENT values
struct SuccessRateValidator : CLI::Validator {
    SuccessRateValidator() {
        name_ = "TYPE=PERCENT";
        func_ = [](const std::string& str) {
            try {
                (void)parse_success_rate(str);
            } catch (const std::invalid_argument& e) {
                return std::string(e.what());
            }
            return std::string(); // ok
        };
    }
};

void add_selection_options(CLI::App* sub, Settings& settings) {
    auto* inputs = sub->add_option("inputs", settings.inputs, "Evidence files or directories.")
        ->check(CLI::ExistingPath);

    sub->add_option("--catalog", settings.catalog_path,
                    "Read the inputs from a JSON catalog instead of the command line.")
        ->check(CLI::ExistingFile)
        ->excludes(inputs);

    sub->add_flag("-r,--recursive", settings.recursive,
                  "Recursively scan input folders.");

    sub->add_option("--include", settings.include_patterns,
                    "Process only files matching regex PATTERN. (Can be used multiple times).");

    sub->add_option("--exclude", settings.exclude_patterns,
                    "Do not process files matching regex PATTERN. (Can be used multiple times).");

    sub->add_option("--recovery-method", settings.recovery_method,
                    "Recovery method recorded for command-line inputs (e.g. fs_based, carved).");
}

void add_oracle_options(CLI::App* sub, Settings& settings) {
    sub->add_flag("--no-decode", settings.no_decode,
                  "Skip the in-process libjpeg / libpng decode checks.");

    sub->add_flag("--no-mime", settings.no_mime,
                  "Skip the libmagic MIME check.");

    sub->add_flag("--external-tools", settings.external_tools,
                  "Also run jpeginfo, pngcheck and identify when installed.");

    sub->add_option("--tool-timeout", settings.tool_timeout_ms,
                    "Timeout in milliseconds for one external tool run.")
        ->default_val(settings.tool_timeout_ms)
        ->check(CLI::PositiveNumber);

    sub->add_option("--min-size", settings.min_size,
                    "Artifacts smaller than this many bytes fail the size check.")
        ->default_val(settings.min_size);

    sub->add_option("--max-decode-mib", settings.max_decode_mib,
                    "Images whose declared pixels need more MiB than this fail the decode check unread.")
        ->default_val(settings.max_decode_mib)
        ->check(CLI::PositiveNumber);

    sub->add_option("--footer-tolerance", settings.footer_tolerance,
                    "Decoder row groups an image may miss and still count as missing_footer.")
        ->default_val(settings.footer_tolerance);
}

void add_repair_options(CLI::App* sub, Settings& settings) {
    sub->add_option("--header-window", settings.header_window,
                    "Maximum garbage prefix in bytes stripped by header reconstruction.")
        ->default_val(settings.header_window)
        ->check(CLI::PositiveNumber);

    sub->add_option("--jpeg-quality", settings.jpeg_quality,
                    "Quality of partial JPEG re-encodes.")
        ->default_val(settings.jpeg_quality)
        ->check(CLI::Range(1, 100));

    sub->add_flag("--no-repaired-output", settings.no_repaired_output,
                  "Repair and report, but do not write repaired files.");
}

void add_decision_options(CLI::App* sub, Settings& settings) {
    sub->add_option("--low-yield-threshold", settings.low_yield_threshold,
                    "Batches with fewer valid artifacts than this are always repaired.")
        ->default_val(settings.low_yield_threshold);

    sub->add_option("--repair-threshold", settings.repair_threshold,
                    "Minimum estimated success rate (percent) to repair.")
        ->default_val(settings.repair_threshold)
        ->check(CLI::Range(0.0, 100.0));

    sub->add_option("--success-rate", settings.success_rates,
                    "Override the expected success rate of a corruption type, e.g. missing_footer=90. "
                    "(Can be used multiple times).")
        ->check(SuccessRateValidator());

    sub->add_option("--override-strategy", settings.override_strategy,
                    "Manually override the decision: perform_repair or skip_repair.")
        ->check(CLI::IsMember({"perform_repair", "skip_repair"}, CLI::ignore_case));

    sub->add_option("--override-justification", settings.override_justification,
                    "Why the automatic decision is overridden.");

    sub->add_option("--override-approver", settings.override_approver,
                    "Who approved the override.");
}

void check_override(const Settings& settings) {
    if (!settings.has_override()) return;
    if (settings.override_strategy.empty()) {
        throw CLI::ValidationError("--override-strategy is required when overriding the decision.");
    }
    if (settings.override_justification.empty() || settings.override_approver.empty()) {
        throw CLI::ValidationError("A manual override needs both --override-justification and --override-approver.");
    }
}

void check_inputs(const Settings& settings) {
    if (settings.inputs.empty() && settings.catalog_path.empty()) {
        throw CLI::ValidationError("No inputs: give files or directories, or --catalog FILE.");
    }
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from a TOML or INI file.");
    app.require_subcommand(1);
    app.fallthrough();

    // --- Global options ---
    app.add_option("-o,--output", settings.output_path,
                   "Directory receiving repaired/ and reports/.")
        ->default_val(settings.output_path);

    app.add_option("--csv", settings.csv_path,
                   "CSV summary export filename.")
        ->take_last(); // if used multiple times, take the last one

    app.add_flag("--dry-run", settings.dry_run,
                 "Classify and decide without writing repaired files or reports.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for classification and repair.")
        ->default_val(settings.num_threads)
        ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
        ->default_val(settings.log_level)
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to a file.");

    // --- run ---
    auto* run = app.add_subcommand("run", "Validate, decide and repair a batch.");
    add_selection_options(run, settings);
    add_oracle_options(run, settings);
    add_repair_options(run, settings);
    add_decision_options(run, settings);
    run->callback([&settings]() {
        settings.command = Command::Run;
        check_inputs(settings);
        check_override(settings);
    });

    // --- validate ---
    auto* validate = app.add_subcommand("validate", "Classify a batch and write the validation report.");
    add_selection_options(validate, settings);
    add_oracle_options(validate, settings);
    validate->callback([&settings]() {
        settings.command = Command::Validate;
        check_inputs(settings);
    });

    // --- decide ---
    auto* decide = app.add_subcommand("decide", "Recompute the batch decision from a validation report or catalog.");
    decide->add_option("--report", settings.report_path,
                       "Validation report or classified catalog.")
        ->required()
        ->check(CLI::ExistingFile);
    add_decision_options(decide, settings);
    decide->callback([&settings]() {
        settings.command = Command::Decide;
        check_override(settings);
    });
}

std::pair<mender::CorruptionType, double> parse_success_rate(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Expected TYPE=PERCENT, got '" + text + "'.");
    }
    const auto type = mender::parse_corruption_type(text.substr(0, eq));
    if (!type || *type == mender::CorruptionType::None) {
        throw std::invalid_argument("Unknown corruption type in '" + text + "'.");
    }

    const std::string number = text.substr(eq + 1);
    double rate = 0.0;
    std::size_t used = 0;
    try {
        rate = std::stod(number, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid percentage in '" + text + "'.");
    }
    if (used != number.size() || rate < 0.0 || rate > 100.0) {
        throw std::invalid_argument("Percentage must be a number between 0 and 100 in '" + text + "'.");
    }
    return {*type, rate};
}

mender::DecisionConfig to_decision_config(const Settings& settings) {
    mender::DecisionConfig config;
    config.low_yield_threshold = settings.low_yield_threshold;
    config.repair_threshold = settings.repair_threshold;
    for (const auto& entry : settings.success_rates) {
        const auto [type, rate] = parse_success_rate(entry);
        config.success_rates[type] = rate;
    }
    return config;
}

std::optional<mender::ManualOverride> to_manual_override(const Settings& settings) {
    if (!settings.has_override()) return std::nullopt;

    std::string name = settings.override_strategy;
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto strategy = mender::parse_strategy(name);
    if (!strategy) {
        throw std::invalid_argument("Unknown strategy '" + settings.override_strategy + "'.");
    }
    return mender::ManualOverride{*strategy, settings.override_justification, settings.override_approver};
}

mender::PipelineOptions to_pipeline_options(const Settings& settings) {
    mender::PipelineOptions options;
    options.output_dir = settings.output_path;
    options.threads = settings.num_threads;
    options.dry_run = settings.dry_run;
    options.write_repaired = !settings.no_repaired_output;
    options.repair = settings.command == Command::Run;
    options.manual_override = to_manual_override(settings);

    options.oracle.min_size = settings.min_size;
    options.oracle.decode_checks = !settings.no_decode;
    options.oracle.mime_check = !settings.no_mime;
    options.oracle.external_tools = settings.external_tools;
    options.oracle.tool_timeout = std::chrono::milliseconds(settings.tool_timeout_ms);
    options.oracle.max_decode_bytes = settings.max_decode_mib * 1024 * 1024;

    options.classifier.footer_tolerance_rows = settings.footer_tolerance;

    options.repair_config.header_search_window = settings.header_window;
    options.repair_config.jpeg_quality = settings.jpeg_quality;
    options.repair_config.max_decode_bytes = options.oracle.max_decode_bytes;

    options.decision = to_decision_config(settings);
    return options;
}
