/**
 * @file report_generator.hpp
 * @brief Console table and CSV summary of a batch.
 */

#ifndef MENDER_REPORT_GENERATOR_HPP
#define MENDER_REPORT_GENERATOR_HPP

#include "../../../libmender/include/recovery_pipeline.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief One line of the per-artifact table.
 */
struct ArtifactRow {
    std::string id;
    std::filesystem::path path;
    std::string format;
    std::string classification;
    std::string type;
    int tier = 0;
    std::string technique;      ///< "-" when none applies
    std::string result;         ///< ok, repaired, failed, skipped, pending
    std::string detail;         ///< output path or reason
};

/**
 * @brief Flatten a batch into table rows: classified artifacts first, then
 * inputs that were never classified, each group in id order.
 */
std::vector<ArtifactRow> rows_from_batch(const mender::BatchResult& batch);

void print_console_report(const std::vector<ArtifactRow>& rows,
                          const mender::BatchResult& batch,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Write the rows and the batch summary as CSV.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<ArtifactRow>& rows,
                       const mender::BatchResult& batch,
                       const std::filesystem::path& output_path,
                       double total_seconds);

unsigned get_terminal_width();

#endif // MENDER_REPORT_GENERATOR_HPP
