/**
 * @file recovery_pipeline.hpp
 * @brief Batch orchestration: classify, decide, repair, re-verify, write.
 */

#ifndef MENDER_RECOVERY_PIPELINE_HPP
#define MENDER_RECOVERY_PIPELINE_HPP

#include "corruption_classifier.hpp"
#include "decision_engine.hpp"
#include "event_bus.hpp"
#include "repair_engine.hpp"
#include "thread_pool.hpp"
#include "validation_oracle.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mender {

    /**
     * @brief One evidence file to process.
     */
    struct InputRecord {
        std::string id;                     ///< Unique within the batch
        std::filesystem::path path;
        std::string recovery_method;
    };

    struct PipelineOptions {
        std::filesystem::path output_dir;   ///< Repaired files go to <output_dir>/repaired
        unsigned threads = 0;               ///< 0 selects the hardware concurrency
        bool dry_run = false;               ///< Never write anything
        bool write_repaired = true;
        bool repair = true;                 ///< false stops after classification

        std::optional<ManualOverride> manual_override;

        OracleConfig oracle;
        ClassifierConfig classifier;
        RepairConfig repair_config;
        DecisionConfig decision;
    };

    struct ClassifiedArtifact {
        ImageArtifact artifact;
        OracleResult oracle;
        CorruptionRecord record;
    };

    struct SkippedInput {
        std::string id;
        std::filesystem::path path;
        std::string reason;
    };

    struct RepairResult {
        RepairOutcome outcome;
        std::optional<std::filesystem::path> output_path;
    };

    struct FinalCounts {
        std::size_t valid = 0;
        std::size_t corrupted = 0;
        std::size_t unrecoverable = 0;
    };

    /**
     * @brief Everything a batch produced. All lists are sorted by artifact id.
     */
    struct BatchResult {
        std::vector<ClassifiedArtifact> artifacts;
        std::vector<SkippedInput> skipped;          ///< Inputs never classified
        BatchStatistics statistics;
        std::optional<DecisionRecord> decision;     ///< Absent when repair is disabled
        std::vector<RepairResult> repairs;          ///< One per corrupted artifact sent to repair
        std::vector<SkippedInput> repair_skipped;   ///< Corrupted or unrecoverable artifacts not repaired
        bool interrupted = false;

        /// Classification counts after repair.
        [[nodiscard]] FinalCounts final_counts() const;
    };

    /**
     * @brief Runs the whole batch on a ThreadPool and reports progress on an EventBus.
     *
     * @details Each pool task writes only its own result slot. Evidence files
     * are read once and never opened for writing. Repaired outputs are
     * written after all repairs finish, in id order, each through a
     * temporary file and a rename.
     */
    class RecoveryPipeline {
    public:
        RecoveryPipeline(PipelineOptions options, EventBus& bus);

        /**
         * @brief Process a batch.
         * @throws FatalPipelineError if an output cannot be written.
         */
        [[nodiscard]] BatchResult run(const std::vector<InputRecord>& inputs);

        /// Thread-safe; queued work is discarded, running tasks see their stop token.
        void request_stop();

        [[nodiscard]] bool is_stopped() const noexcept {
            return stop_flag_.load(std::memory_order_relaxed);
        }

        [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

        /**
         * @brief Build input records from paths, using file names as ids.
         * Duplicate names get a numeric suffix in path order.
         */
        [[nodiscard]] static std::vector<InputRecord> inputs_from_paths(const std::vector<std::filesystem::path>& paths,
                                                                        const std::string& recovery_method = "");

    private:
        void classify_all(const std::vector<InputRecord>& inputs, BatchResult& result);
        void repair_all(BatchResult& result);
        void write_outputs(BatchResult& result) const;

        PipelineOptions options_;
        EventBus& bus_;
        ValidationOracle oracle_;
        CorruptionClassifier classifier_;
        RepairEngine repair_engine_;
        DecisionEngine decision_engine_;
        ThreadPool pool_;
        std::atomic<bool> stop_flag_{false};
    };

} // namespace mender

#endif // MENDER_RECOVERY_PIPELINE_HPP
