/**
 * @file repair_engine.hpp
 * @brief Routes corrupted artifacts to a technique and re-verifies every output.
 */

#ifndef MENDER_REPAIR_ENGINE_HPP
#define MENDER_REPAIR_ENGINE_HPP

#include "corruption_classifier.hpp"
#include "repair_technique.hpp"
#include "validation_oracle.hpp"
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace mender {

    /**
     * @brief One technique variant applied to one artifact. Append-only.
     */
    struct RepairAttempt {
        RepairTechnique technique;
        std::string variant;
        std::string input_artifact_id;
        std::optional<ImageArtifact> output;          ///< Derived artifact, never the evidence itself
        bool success = false;                         ///< Output passed every required check
        std::vector<ValidationVerdict> verdicts_after;
        std::string diagnostic;
    };

    enum class RepairStatus {
        NotNeeded,  ///< Artifact was already valid
        Repaired,
        Failed,
        Rejected    ///< Unrecoverable, never attempted
    };

    [[nodiscard]] std::string_view to_string(RepairStatus status) noexcept;

    struct RepairOutcome {
        std::string artifact_id;
        RepairStatus status = RepairStatus::Failed;
        CorruptionRecord original_record;
        CorruptionRecord final_record;
        std::vector<RepairAttempt> attempts;
        std::optional<ImageArtifact> final_artifact;  ///< Repaired output, or the input when NotNeeded
        std::string diagnostic;

        [[nodiscard]] Classification final_classification() const noexcept { return final_record.classification; }

        /// Technique of the successful attempt, else of the last attempt.
        [[nodiscard]] std::optional<RepairTechnique> technique_used() const noexcept;
    };

    /**
     * @brief Applies the technique mapped to a corruption type, variant by
     * variant, until an output survives the full oracle.
     */
    class RepairEngine {
    public:
        RepairEngine(const ValidationOracle& oracle,
                     const CorruptionClassifier& classifier,
                     RepairConfig config = {});

        /**
         * @brief Repair one artifact.
         * @param artifact Input; never modified.
         * @param record Classification of @p artifact.
         * @param parse Structural facts of @p artifact.
         * @param stop Checked between variants.
         */
        [[nodiscard]] RepairOutcome repair(const ImageArtifact& artifact,
                                           const CorruptionRecord& record,
                                           const ParseOutcome& parse,
                                           std::stop_token stop = {}) const;

        [[nodiscard]] const RepairConfig& config() const noexcept { return config_; }

    private:
        [[nodiscard]] std::unique_ptr<IRepairTechnique> select_technique(const CorruptionRecord& record) const;

        const ValidationOracle& oracle_;
        const CorruptionClassifier& classifier_;
        RepairConfig config_;
    };

} // namespace mender

#endif // MENDER_REPAIR_ENGINE_HPP
