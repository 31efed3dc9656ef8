#include "../../include/reports.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <map>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mender {

    namespace {

        struct Tally {
            std::size_t total = 0;
            std::size_t valid = 0;
            std::size_t corrupted = 0;
            std::size_t unrecoverable = 0;

            void add(const Classification c) {
                ++total;
                switch (c) {
                    case Classification::Valid:         ++valid; break;
                    case Classification::Corrupted:     ++corrupted; break;
                    case Classification::Unrecoverable: ++unrecoverable; break;
                }
            }

            [[nodiscard]] ordered_json to_json() const {
                return {{"total", total}, {"valid", valid}, {"corrupted", corrupted}, {"unrecoverable", unrecoverable}};
            }
        };

        ordered_json technique_json(const std::optional<RepairTechnique>& t) {
            return t ? ordered_json(std::string(to_string(*t))) : ordered_json(nullptr);
        }

        ordered_json skipped_json(const std::vector<SkippedInput>& skipped) {
            ordered_json arr = ordered_json::array();
            for (const auto& s : skipped) {
                arr.push_back({{"id", s.id}, {"path", s.path.generic_string()}, {"reason", s.reason}});
            }
            return arr;
        }

        ordered_json verdicts_json(const std::vector<ValidationVerdict>& verdicts) {
            ordered_json arr = ordered_json::array();
            for (const auto& v : verdicts) {
                ordered_json j{{"name", v.check_name}, {"passed", v.passed}, {"required", v.required}};
                j["diagnostic"] = v.diagnostic ? ordered_json(*v.diagnostic) : ordered_json(nullptr);
                arr.push_back(std::move(j));
            }
            return arr;
        }

        double percent(const std::size_t part, const std::size_t whole) {
            return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
        }

        std::string string_field(const nlohmann::json& j, const char* key) {
            const auto it = j.find(key);
            return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
        }

    } // namespace

    ordered_json make_validation_report(const BatchResult& batch) {
        ordered_json artifacts = ordered_json::array();
        std::map<std::string, Tally> by_format;
        std::map<std::string, Tally> by_source;
        ordered_json needing_repair = ordered_json::array();

        for (const auto& c : batch.artifacts) {
            const auto& a = c.artifact;
            const auto& r = c.record;

            ordered_json checks_run = ordered_json::array();
            ordered_json failed = ordered_json::array();
            for (const auto& v : c.oracle.verdicts) {
                checks_run.push_back(v.check_name);
                if (!v.passed) {
                    failed.push_back({{"name", v.check_name}, {"diagnostic", v.diagnostic.value_or("")}});
                }
            }

            artifacts.push_back({
                {"id", a.id()},
                {"path", a.provenance().source_path.generic_string()},
                {"format", std::string(to_string(a.format()))},
                {"recoveryMethod", a.provenance().recovery_method},
                {"size", a.size()},
                {"classification", std::string(to_string(r.classification))},
                {"corruptionType", std::string(to_string(r.type))},
                {"repairabilityTier", r.tier},
                {"confidence", std::string(to_string(r.confidence))},
                {"checksRun", std::move(checks_run)},
                {"checksUnavailable", c.oracle.unavailable},
                {"failedChecks", std::move(failed)},
                {"recommendedTechnique", technique_json(r.technique)},
            });

            by_format[std::string(to_string(a.format()))].add(r.classification);
            const std::string& source = a.provenance().recovery_method;
            by_source[source.empty() ? "unknown" : source].add(r.classification);
            if (r.classification == Classification::Corrupted) {
                needing_repair.push_back(a.id());
            }
        }

        const auto& s = batch.statistics;
        ordered_json report;
        report["artifacts"] = std::move(artifacts);
        report["summary"] = {
            {"total", s.total},
            {"valid", s.valid},
            {"corrupted", s.corrupted},
            {"unrecoverable", s.unrecoverable},
            {"skipped", batch.skipped.size()},
            {"integrityScore", s.integrity_score()},
        };
        report["byFormat"] = ordered_json::object();
        for (const auto& [fmt, tally] : by_format) report["byFormat"][fmt] = tally.to_json();
        report["bySource"] = ordered_json::object();
        for (const auto& [src, tally] : by_source) report["bySource"][src] = tally.to_json();
        report["filesNeedingRepair"] = std::move(needing_repair);
        report["skipped"] = skipped_json(batch.skipped);
        report["interrupted"] = batch.interrupted;
        return report;
    }

    ordered_json make_decision_report(const DecisionRecord& decision, const BatchStatistics& stats) {
        const BatchDecision& d = decision.automatic;
        ordered_json report{
            {"strategy", std::string(to_string(d.strategy))},
            {"confidence", std::string(to_string(d.confidence))},
            {"rule", "R" + std::to_string(d.rule)},
            {"reasoning", d.reasoning},
            {"estimate", d.estimate},
            {"repairableCount", d.repairable_count},
        };
        report["batch"] = {
            {"total", stats.total},
            {"valid", stats.valid},
            {"corrupted", stats.corrupted},
            {"unrecoverable", stats.unrecoverable},
            {"integrityScore", stats.integrity_score()},
        };
        report["expectedOutcome"] = {
            {"expectedAdditional", d.expected_additional},
            {"finalExpectedCount", d.final_expected_count},
            {"finalExpectedPercent", d.final_expected_percent},
            {"improvementPercentagePoints", d.improvement_percentage_points},
        };
        if (decision.override_) {
            report["manualOverride"] = {
                {"strategy", std::string(to_string(decision.override_->strategy))},
                {"justification", decision.override_->justification},
                {"approver", decision.override_->approver},
            };
        } else {
            report["manualOverride"] = nullptr;
        }
        report["effectiveStrategy"] = std::string(to_string(decision.effective_strategy()));
        return report;
    }

    ordered_json make_repair_report(const BatchResult& batch) {
        ordered_json artifacts = ordered_json::array();
        std::map<std::string, std::pair<std::size_t, std::size_t>> by_type; // attempted, successful
        std::size_t successful = 0;

        for (const auto& r : batch.repairs) {
            const RepairOutcome& o = r.outcome;
            const bool ok = o.status == RepairStatus::Repaired;
            if (ok) ++successful;
            auto& [t_attempted, t_successful] = by_type[std::string(to_string(o.original_record.type))];
            ++t_attempted;
            if (ok) ++t_successful;

            ordered_json attempts = ordered_json::array();
            for (const auto& a : o.attempts) {
                attempts.push_back({
                    {"technique", std::string(to_string(a.technique))},
                    {"variant", a.variant},
                    {"success", a.success},
                    {"diagnostic", a.diagnostic},
                    {"verdictsAfter", verdicts_json(a.verdicts_after)},
                });
            }

            ordered_json entry{
                {"id", o.artifact_id},
                {"originalCorruptionType", std::string(to_string(o.original_record.type))},
                {"techniqueUsed", technique_json(o.technique_used())},
                {"success", ok},
                {"status", std::string(to_string(o.status))},
                {"finalClassification", std::string(to_string(o.final_classification()))},
            };
            if (r.output_path) {
                entry["outputPath"] = r.output_path->generic_string();
            }
            if (!o.diagnostic.empty()) {
                entry["diagnostic"] = o.diagnostic;
            }
            entry["attempts"] = std::move(attempts);
            artifacts.push_back(std::move(entry));
        }

        ordered_json rate_by_type = ordered_json::object();
        for (const auto& [type, counts] : by_type) {
            rate_by_type[type] = {
                {"attempted", counts.first},
                {"successful", counts.second},
                {"rate", percent(counts.second, counts.first)},
            };
        }

        const std::size_t attempted = batch.repairs.size();
        const FinalCounts final_counts = batch.final_counts();

        ordered_json report;
        report["artifacts"] = std::move(artifacts);
        report["summary"] = {
            {"attempted", attempted},
            {"successful", successful},
            {"failed", attempted - successful},
            {"successRate", percent(successful, attempted)},
            {"successRateByType", std::move(rate_by_type)},
        };
        report["skipped"] = skipped_json(batch.repair_skipped);
        report["finalCounts"] = {
            {"valid", final_counts.valid},
            {"corrupted", final_counts.corrupted},
            {"unrecoverable", final_counts.unrecoverable},
        };
        report["interrupted"] = batch.interrupted;
        return report;
    }

    void write_report(const fs::path& path, const ordered_json& report) {
        const std::string text = report.dump(2) + "\n";
        write_file_atomic(path, std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
        Logger::log(LogLevel::Info, "report written: " + path.string(), "reports");
    }

    std::vector<CatalogEntry> load_catalog(const fs::path& path) {
        const auto bytes = read_file_bytes(path);
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(bytes.begin(), bytes.end());
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("invalid JSON in " + path.string() + ": " + e.what());
        }

        const nlohmann::json* list = nullptr;
        if (doc.is_array()) {
            list = &doc;
        } else if (doc.is_object()) {
            for (const char* key : {"files", "artifacts"}) {
                if (const auto it = doc.find(key); it != doc.end() && it->is_array()) {
                    list = &*it;
                    break;
                }
            }
        }
        if (!list) {
            throw std::runtime_error(path.string() + " has no \"files\" or \"artifacts\" list");
        }

        const fs::path base = path.parent_path();
        std::vector<CatalogEntry> entries;
        std::set<std::string> taken;
        for (const auto& rec : *list) {
            if (!rec.is_object()) {
                Logger::log(LogLevel::Warning, "ignoring non-object catalog entry", "reports");
                continue;
            }
            CatalogEntry e;
            const std::string p = string_field(rec, "path");
            e.input.id = string_field(rec, "id");
            if (p.empty() && e.input.id.empty()) {
                Logger::log(LogLevel::Warning, "ignoring catalog entry without path or id", "reports");
                continue;
            }
            if (!p.empty()) {
                fs::path fp(p);
                e.input.path = fp.is_relative() && !base.empty() ? base / fp : fp;
            }
            if (e.input.id.empty()) {
                e.input.id = fs::path(p).filename().string();
            }
            if (std::string id = unique_artifact_id(e.input.id, taken); id != e.input.id) {
                Logger::log(LogLevel::Warning, "duplicate catalog id " + e.input.id + " renamed to " + id, "reports");
                e.input.id = std::move(id);
            }
            e.input.recovery_method = string_field(rec, "recoveryMethod");

            if (const std::string c = string_field(rec, "classification"); !c.empty()) {
                e.classification = parse_classification(c);
                if (!e.classification) {
                    throw std::runtime_error("unknown classification \"" + c + "\" for " + e.input.id);
                }
            }
            if (const std::string t = string_field(rec, "corruptionType"); !t.empty()) {
                e.type = parse_corruption_type(t);
                if (!e.type) {
                    throw std::runtime_error("unknown corruption type \"" + t + "\" for " + e.input.id);
                }
            }
            entries.push_back(std::move(e));
        }
        if (entries.empty()) {
            throw std::runtime_error(path.string() + " lists no usable entries");
        }
        return entries;
    }

    BatchStatistics statistics_from_catalog(const std::vector<CatalogEntry>& entries) {
        std::vector<CorruptionRecord> records;
        records.reserve(entries.size());
        for (const auto& e : entries) {
            if (!e.classification) {
                throw std::runtime_error(e.input.id + " has no classification; run validation first");
            }
            CorruptionRecord r;
            r.classification = *e.classification;
            r.type = e.type.value_or(*e.classification == Classification::Valid ? CorruptionType::None
                                                                                 : CorruptionType::Unknown);
            r.tier = repairability_tier(r.type);
            records.push_back(r);
        }
        return BatchStatistics::from_records(records);
    }

} // namespace mender
