/**
 * @file cli_parser.hpp
 * @brief Command line settings of the mender front end.
 */

#ifndef MENDER_CLI_PARSER_HPP
#define MENDER_CLI_PARSER_HPP

#include "../../../libmender/include/recovery_pipeline.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    Run,        ///< classify, decide, repair
    Validate,   ///< classify only
    Decide      ///< recompute the decision from a report or catalog
};

struct Settings {
    Command command = Command::Run;

    // input selection
    std::vector<std::filesystem::path> inputs;
    std::filesystem::path catalog_path;
    std::filesystem::path report_path;      ///< decide: validation report or catalog
    std::string recovery_method;
    bool recursive = false;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;

    // outputs
    std::filesystem::path output_path = "mender_output";
    std::filesystem::path csv_path;
    bool dry_run = false;
    bool no_repaired_output = false;
    bool quiet = false;

    // logging
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    unsigned num_threads = 1;

    // oracle
    bool no_decode = false;
    bool no_mime = false;
    bool external_tools = false;
    unsigned tool_timeout_ms = 30000;
    std::size_t min_size = 32;
    std::uint64_t max_decode_mib = 512;     ///< Pixel buffer limit for in-process decodes

    // classifier and repair
    unsigned footer_tolerance = 3;
    std::size_t header_window = 64 * 1024;
    int jpeg_quality = 95;

    // decision
    std::size_t low_yield_threshold = 50;
    double repair_threshold = 50.0;
    std::vector<std::string> success_rates;  ///< TYPE=PERCENT
    std::string override_strategy;
    std::string override_justification;
    std::string override_approver;

    [[nodiscard]] bool has_override() const {
        return !override_strategy.empty() || !override_justification.empty() || !override_approver.empty();
    }
};

/**
 * @brief Configures the CLI11 parser with the run, validate and decide
 * subcommands and all their options.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Parse one --success-rate value.
 * @throws std::invalid_argument on an unknown type or a rate outside 0-100.
 */
std::pair<mender::CorruptionType, double> parse_success_rate(const std::string& text);

/**
 * @brief Map the parsed settings onto the decision configuration.
 * @throws std::invalid_argument on a malformed --success-rate value.
 */
mender::DecisionConfig to_decision_config(const Settings& settings);

/**
 * @brief The manual override described by the --override-* options, if any.
 */
std::optional<mender::ManualOverride> to_manual_override(const Settings& settings);

/**
 * @brief Map the parsed settings onto the pipeline options.
 * @throws std::invalid_argument on a malformed --success-rate value.
 */
mender::PipelineOptions to_pipeline_options(const Settings& settings);

#endif // MENDER_CLI_PARSER_HPP
