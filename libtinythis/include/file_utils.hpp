#ifndef TINYTHIS_FILE_UTILS_HPP
#define TINYTHIS_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tinythis {

    /**
     * @brief Size of a regular file, or 0 if it is missing or unreadable.
     */
    std::uintmax_t safe_file_size(const std::filesystem::path& path) noexcept;

    /**
     * @brief Formats a byte count as "512 B", "1.5 KiB", "3.2 MiB" or "1.1 GiB".
     */
    std::string human_size(std::uintmax_t bytes);

    /**
     * @brief Checks that new files can be created in @p dir.
     */
    bool is_directory_writable(const std::filesystem::path& dir) noexcept;

    /**
     * @brief Removes a (possibly partial) output file and logs the outcome.
     * A missing file is not an error.
     * @return false if the file exists and could not be removed.
     */
    bool remove_output(const std::filesystem::path& path,
                       std::string_view tag = "file_utils");

    /**
     * @brief Writes @p contents to @p target through a temporary sibling and a rename.
     * @throws std::filesystem::filesystem_error on failure.
     */
    void write_file_atomically(const std::filesystem::path& target, std::string_view contents);

} // namespace tinythis

#endif // TINYTHIS_FILE_UTILS_HPP
