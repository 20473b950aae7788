#ifndef TINYTHIS_INPUT_FILE_HPP
#define TINYTHIS_INPUT_FILE_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace tinythis {

/**
 * @brief A validated source video.
 *
 * Only produced by InputFile::validate, so holding one means the file
 * existed with a supported extension when it was enqueued.
 */
struct InputFile {
    std::filesystem::path path;   ///< Absolute, lexically normalized
    std::string extension;        ///< Lower-case, with the leading dot
    std::uintmax_t size_bytes = 0;

    /**
     * @brief Checks extension, existence and file type, in that order.
     * @throws ValidationError with the matching reason.
     */
    [[nodiscard]] static InputFile validate(const std::filesystem::path& path);
};

/// Extensions accepted as encoder input, lower-case.
[[nodiscard]] std::span<const std::string_view> supported_extensions() noexcept;

/// Case-insensitive allow-list check on the extension only.
[[nodiscard]] bool is_supported_video(const std::filesystem::path& path);

} // namespace tinythis

#endif // TINYTHIS_INPUT_FILE_HPP
