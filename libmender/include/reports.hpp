/**
 * @file reports.hpp
 * @brief Validation, decision and repair reports as JSON, and input documents.
 *
 * Reports carry no timestamps and list artifacts in id order, so two runs
 * over the same evidence produce byte-identical documents.
 */

#ifndef MENDER_REPORTS_HPP
#define MENDER_REPORTS_HPP

#include "recovery_pipeline.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace mender {

    using ordered_json = nlohmann::ordered_json;

    [[nodiscard]] ordered_json make_validation_report(const BatchResult& batch);

    [[nodiscard]] ordered_json make_decision_report(const DecisionRecord& decision, const BatchStatistics& stats);

    [[nodiscard]] ordered_json make_repair_report(const BatchResult& batch);

    /**
     * @brief Serialize with two-space indentation through an atomic write.
     * @throws FatalPipelineError on write failure.
     */
    void write_report(const std::filesystem::path& path, const ordered_json& report);

    /**
     * @brief One entry of an input document.
     */
    struct CatalogEntry {
        InputRecord input;
        std::optional<Classification> classification;
        std::optional<CorruptionType> type;
    };

    /**
     * @brief Load a catalog ({"files": [...]} or a bare array) or a
     * validation report ({"artifacts": [...]}).
     *
     * Relative paths are resolved against the document's directory.
     * @throws std::runtime_error if the document cannot be read or has no
     * usable entries.
     */
    [[nodiscard]] std::vector<CatalogEntry> load_catalog(const std::filesystem::path& path);

    /**
     * @brief Batch statistics from already classified entries.
     * @throws std::runtime_error if an entry carries no classification.
     */
    [[nodiscard]] BatchStatistics statistics_from_catalog(const std::vector<CatalogEntry>& entries);

} // namespace mender

#endif // MENDER_REPORTS_HPP
