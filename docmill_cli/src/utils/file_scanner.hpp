#ifndef DOCMILL_FILE_SCANNER_HPP
#define DOCMILL_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief Expands the command line inputs into a sorted list of regular files.
 *
 * Directories contribute their files (all levels when `recursive` is set).
 * OS metadata files (.DS_Store, desktop.ini, AppleDouble "._" files) are skipped.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs, bool recursive);

#endif // DOCMILL_FILE_SCANNER_HPP
