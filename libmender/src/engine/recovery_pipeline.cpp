#include "../../include/recovery_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace mender {

    namespace {

        constexpr std::string_view kTag = "pipeline";
        const std::string kInterrupted = "Interrupted";

        /// What a classification task leaves in its slot.
        struct ClassifySlot {
            std::optional<ClassifiedArtifact> classified;
            std::optional<SkippedInput> skipped;
        };

        template <typename T>
        void sort_by_id(std::vector<T>& v) {
            std::ranges::sort(v, {}, [](const T& e) -> const std::string& { return e.id; });
        }

        std::string output_name(const ClassifiedArtifact& c) {
            const fs::path& src = c.artifact.provenance().source_path;
            std::string name = src.empty() ? c.artifact.id() : src.filename().string();
            const std::string ext = fs::path(name).extension().string();
            if (ext.empty()) {
                name += c.artifact.format() == ImageFormat::Png ? ".png" : ".jpg";
            }
            return name;
        }

    } // namespace

    FinalCounts BatchResult::final_counts() const {
        FinalCounts counts;
        std::map<std::string_view, Classification> after;
        for (const auto& r : repairs) {
            after.emplace(r.outcome.artifact_id, r.outcome.final_classification());
        }
        for (const auto& c : artifacts) {
            Classification cls = c.record.classification;
            if (const auto it = after.find(c.artifact.id()); it != after.end()) {
                cls = it->second;
            }
            switch (cls) {
                case Classification::Valid:         ++counts.valid; break;
                case Classification::Corrupted:     ++counts.corrupted; break;
                case Classification::Unrecoverable: ++counts.unrecoverable; break;
            }
        }
        return counts;
    }

    RecoveryPipeline::RecoveryPipeline(PipelineOptions options, EventBus& bus)
        : options_(std::move(options)),
          bus_(bus),
          oracle_(options_.oracle),
          classifier_(options_.classifier),
          repair_engine_(oracle_, classifier_, options_.repair_config),
          decision_engine_(options_.decision),
          pool_(options_.threads) {
        Logger::log(LogLevel::Debug,
                    "pipeline ready with " + std::to_string(pool_.size()) + " workers, checks: " +
                    std::to_string(oracle_.check_names().size()),
                    kTag);
    }

    std::vector<InputRecord> RecoveryPipeline::inputs_from_paths(const std::vector<fs::path>& paths,
                                                                 const std::string& recovery_method) {
        std::vector<fs::path> sorted = paths;
        std::ranges::sort(sorted);

        std::set<std::string> taken;
        std::vector<InputRecord> inputs;
        inputs.reserve(sorted.size());
        for (const auto& p : sorted) {
            inputs.push_back({unique_artifact_id(p.filename().string(), taken), p, recovery_method});
        }
        return inputs;
    }

    void RecoveryPipeline::request_stop() {
        if (stop_flag_.exchange(true)) {
            return;
        }
        Logger::log(LogLevel::Warning, "stop requested, finishing running tasks", kTag);
        pool_.request_stop();
    }

    BatchResult RecoveryPipeline::run(const std::vector<InputRecord>& inputs) {
        BatchResult result;

        classify_all(inputs, result);
        result.statistics = BatchStatistics::from_records([&] {
            std::vector<CorruptionRecord> records;
            records.reserve(result.artifacts.size());
            for (const auto& c : result.artifacts) records.push_back(c.record);
            return records;
        }());
        Logger::log(LogLevel::Info,
                    "classified " + std::to_string(result.statistics.total) + " artifacts: " +
                    std::to_string(result.statistics.valid) + " valid, " +
                    std::to_string(result.statistics.corrupted) + " corrupted, " +
                    std::to_string(result.statistics.unrecoverable) + " unrecoverable, " +
                    std::to_string(result.skipped.size()) + " skipped",
                    kTag);

        if (is_stopped()) {
            result.interrupted = true;
            return result;
        }
        if (!options_.repair) {
            return result;
        }

        const BatchDecision automatic = decision_engine_.decide(result.statistics);
        result.decision = options_.manual_override ? apply_override(automatic, *options_.manual_override)
                                                   : DecisionRecord{automatic, std::nullopt};
        bus_.publish(BatchDecisionEvent{*result.decision, result.statistics.integrity_score()});

        for (const auto& c : result.artifacts) {
            if (c.record.classification == Classification::Unrecoverable) {
                result.repair_skipped.push_back({c.artifact.id(), c.artifact.provenance().source_path,
                                                 "Unrecoverable"});
            }
        }

        if (result.decision->effective_strategy() == Strategy::PerformRepair) {
            repair_all(result);
        } else {
            for (const auto& c : result.artifacts) {
                if (c.record.classification == Classification::Corrupted) {
                    result.repair_skipped.push_back({c.artifact.id(), c.artifact.provenance().source_path,
                                                     "Repair skipped by decision"});
                }
            }
        }
        sort_by_id(result.repair_skipped);

        if (is_stopped()) {
            result.interrupted = true;
        }
        if (!options_.dry_run && options_.write_repaired && !options_.output_dir.empty()) {
            write_outputs(result);
        }
        return result;
    }

    void RecoveryPipeline::classify_all(const std::vector<InputRecord>& inputs, BatchResult& result) {
        std::vector<ClassifySlot> slots(inputs.size());
        std::vector<std::future<void>> futures;
        futures.reserve(inputs.size());
        std::atomic<std::size_t> completed{0};
        const std::size_t total = inputs.size();

        for (std::size_t i = 0; i < inputs.size(); ++i) {
            if (is_stopped()) break;
            auto task = [this, &slots, &inputs, &completed, total, i](const std::stop_token& st) {
                const InputRecord& in = inputs[i];
                ClassifySlot& slot = slots[i];
                if (st.stop_requested()) {
                    slot.skipped = SkippedInput{in.id, in.path, kInterrupted};
                    return;
                }

                std::vector<std::uint8_t> bytes;
                try {
                    bytes = read_file_bytes(in.path);
                } catch (const std::runtime_error& e) {
                    Logger::log(LogLevel::Warning, std::string("Unreadable: ") + e.what(), kTag);
                    slot.skipped = SkippedInput{in.id, in.path, std::string("Unreadable: ") + e.what()};
                    bus_.publish(ArtifactSkippedEvent{in.id, in.path, slot.skipped->reason});
                    return;
                }

                const ImageFormat format = detect_format(bytes, in.path);
                if (format == ImageFormat::Unknown) {
                    Logger::log(LogLevel::Info, "unsupported format: " + in.path.string(), kTag);
                    slot.skipped = SkippedInput{in.id, in.path, "Unsupported format"};
                    bus_.publish(ArtifactSkippedEvent{in.id, in.path, slot.skipped->reason});
                    return;
                }

                ImageArtifact artifact(in.id, std::move(bytes), Provenance{in.path, in.recovery_method, {}}, format);
                OracleResult oracle = oracle_.validate(artifact);
                const CorruptionRecord record = classifier_.classify(oracle);
                slot.classified = ClassifiedArtifact{std::move(artifact), std::move(oracle), record};

                bus_.publish(ArtifactClassifiedEvent{in.id, in.path, format, record,
                                                     completed.fetch_add(1) + 1, total});
            };
            try {
                futures.push_back(pool_.enqueue(std::move(task)));
            } catch (const std::runtime_error&) {
                break; // pool stopped between the check and the enqueue
            }
        }

        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::future_error&) {
                // task discarded by request_stop(); the slot stays empty
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, inputs[i].id + ": classification failed: " + e.what(), kTag);
                slots[i].skipped = SkippedInput{inputs[i].id, inputs[i].path,
                                                std::string("Classification failed: ") + e.what()};
            }
        }

        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (slots[i].classified) {
                result.artifacts.push_back(std::move(*slots[i].classified));
            } else if (slots[i].skipped) {
                result.skipped.push_back(std::move(*slots[i].skipped));
            } else {
                result.skipped.push_back({inputs[i].id, inputs[i].path, kInterrupted});
                bus_.publish(ArtifactSkippedEvent{inputs[i].id, inputs[i].path, kInterrupted});
            }
        }
        std::ranges::sort(result.artifacts, {}, [](const ClassifiedArtifact& c) -> const std::string& {
            return c.artifact.id();
        });
        sort_by_id(result.skipped);
    }

    void RecoveryPipeline::repair_all(BatchResult& result) {
        std::vector<const ClassifiedArtifact*> work;
        for (const auto& c : result.artifacts) {
            if (c.record.classification == Classification::Corrupted) {
                work.push_back(&c);
            }
        }

        std::vector<std::optional<RepairOutcome>> slots(work.size());
        std::vector<std::future<void>> futures;
        futures.reserve(work.size());
        std::atomic<std::size_t> completed{0};
        const std::size_t total = work.size();

        for (std::size_t i = 0; i < work.size(); ++i) {
            if (is_stopped()) break;
            auto task = [this, &slots, &work, &completed, total, i](const std::stop_token& st) {
                if (st.stop_requested()) return;
                const ClassifiedArtifact& c = *work[i];
                bus_.publish(RepairStartEvent{c.artifact.id(), c.record.type, c.record.technique});

                const auto start = std::chrono::steady_clock::now();
                RepairOutcome outcome = repair_engine_.repair(c.artifact, c.record, c.oracle.parse, st);
                const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);

                bus_.publish(RepairCompleteEvent{c.artifact.id(), outcome.status, outcome.final_classification(),
                                                 duration, completed.fetch_add(1) + 1, total});
                slots[i] = std::move(outcome);
            };
            try {
                futures.push_back(pool_.enqueue(std::move(task)));
            } catch (const std::runtime_error&) {
                break;
            }
        }

        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::future_error&) {
                // discarded by request_stop()
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, work[i]->artifact.id() + ": repair task failed: " + e.what(), kTag);
                RepairOutcome failed;
                failed.artifact_id = work[i]->artifact.id();
                failed.original_record = work[i]->record;
                failed.final_record = work[i]->record;
                failed.status = RepairStatus::Failed;
                failed.diagnostic = e.what();
                slots[i] = std::move(failed);
            }
        }

        for (std::size_t i = 0; i < work.size(); ++i) {
            const bool untouched = !slots[i] || (slots[i]->diagnostic == kInterrupted && slots[i]->attempts.empty());
            if (!untouched) {
                result.repairs.push_back({std::move(*slots[i]), std::nullopt});
            } else {
                result.repair_skipped.push_back({work[i]->artifact.id(), work[i]->artifact.provenance().source_path,
                                                 kInterrupted});
            }
        }
        std::ranges::sort(result.repairs, {}, [](const RepairResult& r) -> const std::string& {
            return r.outcome.artifact_id;
        });
    }

    void RecoveryPipeline::write_outputs(BatchResult& result) const {
        const fs::path dir = options_.output_dir / "repaired";
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw FatalPipelineError("cannot create output directory " + dir.string() + ": " + ec.message());
        }

        std::map<std::string_view, const ClassifiedArtifact*> by_id;
        for (const auto& c : result.artifacts) {
            by_id.emplace(c.artifact.id(), &c);
        }

        for (auto& r : result.repairs) {
            if (r.outcome.status != RepairStatus::Repaired || !r.outcome.final_artifact) {
                continue;
            }
            const auto it = by_id.find(r.outcome.artifact_id);
            if (it == by_id.end()) {
                continue;
            }
            const fs::path dest = unique_destination(dir, output_name(*it->second));
            write_file_atomic(dest, r.outcome.final_artifact->bytes());
            r.output_path = dest;
            Logger::log(LogLevel::Info, "wrote " + dest.string(), kTag);
        }
    }

} // namespace mender
