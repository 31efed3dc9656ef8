#include "../../include/repair_engine.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <algorithm>

namespace mender {

    namespace {

        constexpr std::string_view kTag = "repair_engine";

        void verify(const OracleResult& after) {
            if (after.passes_required()) {
                return;
            }
            std::string failed;
            for (const auto& v : after.verdicts) {
                if (v.required && !v.passed) {
                    if (!failed.empty()) failed += "; ";
                    failed += v.check_name;
                    if (v.diagnostic) failed += " (" + *v.diagnostic + ")";
                }
            }
            throw RepairVerificationFailed("output failed re-validation: " + failed);
        }

    } // namespace

    std::string_view to_string(const RepairStatus status) noexcept {
        switch (status) {
            case RepairStatus::NotNeeded: return "not_needed";
            case RepairStatus::Repaired:  return "repaired";
            case RepairStatus::Failed:    return "failed";
            case RepairStatus::Rejected:  return "rejected";
        }
        return "failed";
    }

    std::optional<RepairTechnique> RepairOutcome::technique_used() const noexcept {
        if (attempts.empty()) return std::nullopt;
        const auto ok = std::ranges::find_if(attempts, &RepairAttempt::success);
        return ok != attempts.end() ? ok->technique : attempts.back().technique;
    }

    RepairEngine::RepairEngine(const ValidationOracle& oracle,
                               const CorruptionClassifier& classifier,
                               RepairConfig config)
        : oracle_(oracle), classifier_(classifier), config_(config) {}

    std::unique_ptr<IRepairTechnique> RepairEngine::select_technique(const CorruptionRecord& record) const {
        const auto technique = technique_for(record.type);
        if (!technique) {
            throw TechniqueNotApplicable("no repair technique for corruption type " +
                                         std::string(to_string(record.type)));
        }
        return make_technique(*technique, config_);
    }

    RepairOutcome RepairEngine::repair(const ImageArtifact& artifact,
                                       const CorruptionRecord& record,
                                       const ParseOutcome& parse,
                                       const std::stop_token stop) const {
        RepairOutcome outcome;
        outcome.artifact_id = artifact.id();
        outcome.original_record = record;
        outcome.final_record = record;

        switch (record.classification) {
            case Classification::Valid:
                outcome.status = RepairStatus::NotNeeded;
                outcome.final_artifact = artifact;
                return outcome;
            case Classification::Unrecoverable:
                outcome.status = RepairStatus::Rejected;
                outcome.diagnostic = "unrecoverable artifacts are not repaired";
                return outcome;
            case Classification::Corrupted:
                break;
        }

        std::unique_ptr<IRepairTechnique> technique;
        try {
            technique = select_technique(record);
        } catch (const TechniqueNotApplicable& e) {
            Logger::log(LogLevel::Info, artifact.id() + ": " + e.what(), kTag);
            outcome.status = RepairStatus::Failed;
            outcome.diagnostic = e.what();
            return outcome;
        }
        if (!parse.ok()) {
            outcome.status = RepairStatus::Failed;
            outcome.diagnostic = "no container structure: " + parse.error;
            return outcome;
        }

        for (std::size_t i = 0; i < technique->variant_count(); ++i) {
            if (stop.stop_requested()) {
                outcome.diagnostic = "Interrupted";
                break;
            }

            RepairCandidate candidate = technique->attempt(i, artifact, *parse.structure);
            RepairAttempt attempt{technique->id(), candidate.variant, artifact.id()};

            if (!candidate.produced()) {
                Logger::log(LogLevel::Debug,
                            artifact.id() + ": " + candidate.variant + " not applicable: " + candidate.diagnostic,
                            kTag);
                attempt.diagnostic = std::move(candidate.diagnostic);
                outcome.attempts.push_back(std::move(attempt));
                continue;
            }

            ImageArtifact derived = artifact.derive(std::string(to_string(technique->id())) + "." + candidate.variant,
                                                    std::move(*candidate.bytes));
            const OracleResult after = oracle_.validate(derived);
            attempt.verdicts_after = after.verdicts;
            attempt.output = derived;

            try {
                verify(after);
            } catch (const RepairVerificationFailed& e) {
                Logger::log(LogLevel::Info, artifact.id() + ": " + candidate.variant + ": " + e.what(), kTag);
                attempt.diagnostic = e.what();
                outcome.attempts.push_back(std::move(attempt));
                continue;
            }

            attempt.success = true;
            attempt.diagnostic = std::move(candidate.diagnostic);
            outcome.attempts.push_back(std::move(attempt));
            outcome.final_record = classifier_.classify(after);
            outcome.final_artifact = std::move(derived);
            outcome.status = RepairStatus::Repaired;
            Logger::log(LogLevel::Info,
                        artifact.id() + " repaired by " + std::string(to_string(technique->id())) + " (" +
                        outcome.attempts.back().variant + "), now " +
                        std::string(to_string(outcome.final_record.classification)),
                        kTag);
            return outcome;
        }

        outcome.status = RepairStatus::Failed;
        if (outcome.diagnostic.empty()) {
            outcome.diagnostic = "all " + std::to_string(technique->variant_count()) + " variants of " +
                                 std::string(to_string(technique->id())) + " failed";
        }
        Logger::log(LogLevel::Warning, artifact.id() + ": " + outcome.diagnostic, kTag);
        return outcome;
    }

} // namespace mender
