/**
 * @file file_scanner.hpp
 * @brief Expands command line inputs into the list of evidence files.
 */

#ifndef MENDER_FILE_SCANNER_HPP
#define MENDER_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

struct Settings; // Forward declaration

/**
 * @brief Regular files named by the inputs, directories expanded (recursively
 * with --recursive), junk files and --include / --exclude filtering applied.
 * @return Sorted paths without duplicates.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

/**
 * @brief Operating-system clutter (AppleDouble files, .DS_Store, Thumbs.db).
 */
bool is_junk(const std::filesystem::path& p);

#endif // MENDER_FILE_SCANNER_HPP
