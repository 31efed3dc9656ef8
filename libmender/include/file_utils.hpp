/**
 * @file file_utils.hpp
 * @brief Evidence reads, atomic output writes and temporary directories.
 */

#ifndef MENDER_FILE_UTILS_HPP
#define MENDER_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mender {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Read a whole file into memory. The file is opened read-only.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    [[nodiscard]] std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path);

    /**
     * @brief Write bytes to @p dest through a temporary sibling and a rename,
     * so a partially written file is never visible under the final name.
     * @throws FatalPipelineError if the file cannot be written or renamed.
     */
    void write_file_atomic(const std::filesystem::path& dest, std::span<const std::uint8_t> bytes);

    /**
     * @brief First free path "<dir>/<stem><ext>", "<dir>/<stem>_1<ext>", ...
     */
    [[nodiscard]] std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                                           const std::string& filename);

    /// Random alphanumeric string for temporary names.
    [[nodiscard]] std::string random_suffix(std::size_t length = 8);

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Creates a directory inside the system temp path using a
     * "mender-{prefix}/{prefix}_{filename_stem}_{random_suffix}" pattern.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path,
                                            const std::string& prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     */
    void cleanup_temp_dir(const std::filesystem::path& dir,
                          std::string_view tag = "file_utils");

} // namespace mender

#endif // MENDER_FILE_UTILS_HPP
