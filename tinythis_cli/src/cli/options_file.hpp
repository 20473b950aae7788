#ifndef TINYTHIS_OPTIONS_FILE_HPP
#define TINYTHIS_OPTIONS_FILE_HPP

#include <filesystem>
#include <string>

/**
 * @brief Returns @p contents with the `gpu` key set to @p gpu.
 *
 * An existing top-level `gpu = ...` line is replaced in place; otherwise
 * the key is appended. Every other line is kept as is.
 */
std::string with_gpu_preference(const std::string& contents, bool gpu);

/**
 * @brief Persists the accelerator choice into the options file.
 *
 * Reads the current file if there is one and rewrites it atomically.
 * @throws std::filesystem::filesystem_error if the file cannot be written.
 */
void save_gpu_preference(const std::filesystem::path& options_file, bool gpu);

#endif // TINYTHIS_OPTIONS_FILE_HPP
