/**
 * @file decision_engine.hpp
 * @brief Batch-level cost/benefit rule deciding whether repair is worth running.
 */

#ifndef MENDER_DECISION_ENGINE_HPP
#define MENDER_DECISION_ENGINE_HPP

#include "corruption.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mender {

    enum class Strategy {
        PerformRepair,
        SkipRepair
    };

    [[nodiscard]] std::string_view to_string(Strategy s) noexcept;
    [[nodiscard]] std::optional<Strategy> parse_strategy(std::string_view s) noexcept;

    struct DecisionConfig {
        /// Expected repair success per corruption type, in percent.
        std::map<CorruptionType, double> success_rates{
            {CorruptionType::MissingFooter, 85.0},
            {CorruptionType::InvalidHeader, 70.0},
            {CorruptionType::CorruptSegments, 60.0},
            {CorruptionType::Truncated, 50.0},
            {CorruptionType::Unknown, 50.0},
            {CorruptionType::CorruptData, 40.0},
            {CorruptionType::Fragmented, 15.0},
            {CorruptionType::FalsePositive, 0.0},
        };
        std::size_t low_yield_threshold = 50;  ///< Fewer valid artifacts than this always repair
        double repair_threshold = 50.0;        ///< Minimum estimate (percent) to repair
        double high_confidence_margin = 20.0;
        double medium_confidence_margin = 5.0;

        [[nodiscard]] double rate_for(CorruptionType type) const;
    };

    struct BatchStatistics {
        std::size_t total = 0;
        std::size_t valid = 0;
        std::size_t corrupted = 0;
        std::size_t unrecoverable = 0;
        std::vector<CorruptionType> corruption_types; ///< One entry per corrupted artifact

        /// valid / total * 100, 0 for an empty batch.
        [[nodiscard]] double integrity_score() const noexcept;

        /// Aggregate a batch of classification records.
        [[nodiscard]] static BatchStatistics from_records(const std::vector<CorruptionRecord>& records);
    };

    struct BatchDecision {
        Strategy strategy = Strategy::SkipRepair;
        Confidence confidence = Confidence::High;
        int rule = 0;                           ///< Number of the rule that fired (1-5)
        double estimate = 0.0;                  ///< Average success rate over the repair pool
        std::size_t repairable_count = 0;
        double expected_additional = 0.0;
        double final_expected_count = 0.0;
        double final_expected_percent = 0.0;
        double improvement_percentage_points = 0.0;
        std::string reasoning;

        bool operator==(const BatchDecision&) const = default;
    };

    struct ManualOverride {
        Strategy strategy = Strategy::SkipRepair;
        std::string justification;
        std::string approver;
    };

    struct DecisionRecord {
        BatchDecision automatic;
        std::optional<ManualOverride> override_;

        [[nodiscard]] Strategy effective_strategy() const noexcept {
            return override_ ? override_->strategy : automatic.strategy;
        }
    };

    /**
     * @brief Pure rule evaluator over batch statistics.
     */
    class DecisionEngine {
    public:
        explicit DecisionEngine(DecisionConfig config = {});

        [[nodiscard]] BatchDecision decide(const BatchStatistics& stats) const;

        [[nodiscard]] const DecisionConfig& config() const noexcept { return config_; }

    private:
        const DecisionConfig config_;
    };

    /**
     * @brief Record a human override next to the automatic decision.
     * @throws std::invalid_argument if the justification or approver is blank.
     */
    [[nodiscard]] DecisionRecord apply_override(const BatchDecision& decision, ManualOverride override_);

} // namespace mender

#endif // MENDER_DECISION_ENGINE_HPP
