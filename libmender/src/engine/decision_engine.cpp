#include "../../include/decision_engine.hpp"
#include "../../include/logger.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace mender {

    namespace {

        std::string fmt(const double v) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f", v);
            return buf;
        }

        // unknown sits in tier 3 but has no technique to run
        bool in_repair_pool(const CorruptionType type) {
            return is_repairable_tier(repairability_tier(type)) && technique_for(type).has_value();
        }

        bool blank(const std::string& s) {
            for (const unsigned char c : s) {
                if (!std::isspace(c)) return false;
            }
            return true;
        }

    } // namespace

    std::string_view to_string(const Strategy s) noexcept {
        switch (s) {
            case Strategy::PerformRepair: return "perform_repair";
            case Strategy::SkipRepair:    return "skip_repair";
        }
        return "skip_repair";
    }

    std::optional<Strategy> parse_strategy(const std::string_view s) noexcept {
        if (s == "perform_repair") return Strategy::PerformRepair;
        if (s == "skip_repair") return Strategy::SkipRepair;
        return std::nullopt;
    }

    double DecisionConfig::rate_for(const CorruptionType type) const {
        const auto it = success_rates.find(type);
        return it == success_rates.end() ? 0.0 : it->second;
    }

    double BatchStatistics::integrity_score() const noexcept {
        return total == 0 ? 0.0 : static_cast<double>(valid) / static_cast<double>(total) * 100.0;
    }

    BatchStatistics BatchStatistics::from_records(const std::vector<CorruptionRecord>& records) {
        BatchStatistics stats;
        stats.total = records.size();
        for (const auto& r : records) {
            switch (r.classification) {
                case Classification::Valid:
                    ++stats.valid;
                    break;
                case Classification::Corrupted:
                    ++stats.corrupted;
                    stats.corruption_types.push_back(r.type);
                    break;
                case Classification::Unrecoverable:
                    ++stats.unrecoverable;
                    break;
            }
        }
        return stats;
    }

    DecisionEngine::DecisionEngine(DecisionConfig config) : config_(std::move(config)) {}

    BatchDecision DecisionEngine::decide(const BatchStatistics& stats) const {
        BatchDecision d;

        double rate_sum = 0.0;
        for (const CorruptionType type : stats.corruption_types) {
            if (in_repair_pool(type)) {
                ++d.repairable_count;
                rate_sum += config_.rate_for(type);
            }
        }
        d.estimate = d.repairable_count == 0 ? 0.0 : rate_sum / static_cast<double>(d.repairable_count);

        const std::string inputs = "valid=" + std::to_string(stats.valid) + "/" + std::to_string(stats.total) +
                                   ", corrupted=" + std::to_string(stats.corrupted) +
                                   ", repairable=" + std::to_string(d.repairable_count) +
                                   ", estimate=" + fmt(d.estimate) + "%";

        if (stats.corrupted == 0) {
            d.rule = 1;
            d.strategy = Strategy::SkipRepair;
            d.confidence = Confidence::High;
            d.reasoning = "R1: no corrupted artifacts, nothing to repair (" + inputs + ")";
        } else if (d.repairable_count == 0) {
            d.rule = 2;
            d.strategy = Strategy::SkipRepair;
            d.confidence = Confidence::High;
            d.reasoning = "R2: no corrupted artifact has a repairable tier and a repair technique (" + inputs + ")";
        } else if (stats.valid < config_.low_yield_threshold) {
            d.rule = 3;
            d.strategy = Strategy::PerformRepair;
            d.confidence = Confidence::High;
            d.reasoning = "R3: only " + std::to_string(stats.valid) + " valid artifacts, below the low-yield threshold of " +
                          std::to_string(config_.low_yield_threshold) + "; every recoverable image counts (" + inputs + ")";
        } else if (d.estimate >= config_.repair_threshold) {
            d.rule = 4;
            d.strategy = Strategy::PerformRepair;
            const double margin = d.estimate - config_.repair_threshold;
            d.confidence = margin >= config_.high_confidence_margin     ? Confidence::High
                           : margin >= config_.medium_confidence_margin ? Confidence::Medium
                                                                        : Confidence::Low;
            d.reasoning = "R4: estimated success " + fmt(d.estimate) + "% meets the repair threshold of " +
                          fmt(config_.repair_threshold) + "% (margin " + fmt(margin) + " points; " + inputs + ")";
        } else {
            d.rule = 5;
            d.strategy = Strategy::SkipRepair;
            d.confidence = Confidence::Medium;
            d.reasoning = "R5: estimated success " + fmt(d.estimate) + "% is below the repair threshold of " +
                          fmt(config_.repair_threshold) + "% (" + inputs + ")";
        }

        if (d.strategy == Strategy::PerformRepair) {
            d.expected_additional = static_cast<double>(d.repairable_count) * d.estimate / 100.0;
        }
        d.final_expected_count = static_cast<double>(stats.valid) + d.expected_additional;
        d.final_expected_percent = stats.total == 0
                                       ? 0.0
                                       : d.final_expected_count / static_cast<double>(stats.total) * 100.0;
        d.improvement_percentage_points = d.final_expected_percent - stats.integrity_score();

        Logger::log(LogLevel::Info,
                    std::string(to_string(d.strategy)) + " (" + std::string(to_string(d.confidence)) + "): " + d.reasoning,
                    "decision_engine");
        return d;
    }

    DecisionRecord apply_override(const BatchDecision& decision, ManualOverride override_) {
        if (blank(override_.justification)) {
            throw std::invalid_argument("manual override requires a justification");
        }
        if (blank(override_.approver)) {
            throw std::invalid_argument("manual override requires an approver");
        }
        Logger::log(LogLevel::Warning,
                    "decision overridden to " + std::string(to_string(override_.strategy)) + " by " +
                    override_.approver + ": " + override_.justification,
                    "decision_engine");
        return DecisionRecord{decision, std::move(override_)};
    }

} // namespace mender
