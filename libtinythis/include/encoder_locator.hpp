/**
 * @file encoder_locator.hpp
 * @brief Answers the one question the core asks about the encoder install:
 * is there an executable, and where.
 */

#ifndef TINYTHIS_ENCODER_LOCATOR_HPP
#define TINYTHIS_ENCODER_LOCATOR_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tinythis {

/**
 * @brief Abstract encoder lookup.
 *
 * Implementations never download or install anything. The queue asks
 * before every job start, so an encoder that disappears mid-session is
 * noticed.
 */
class IEncoderLocator {
public:
    virtual ~IEncoderLocator() = default;

    /// Path to an executable encoder, or std::nullopt if none is available.
    [[nodiscard]] virtual std::optional<std::filesystem::path> locate() const = 0;
};

/// True if @p path is a regular file the current user may execute.
[[nodiscard]] bool is_executable_file(const std::filesystem::path& path) noexcept;

/**
 * @brief Always answers with one configured path, if it is executable.
 */
class FixedEncoderLocator final : public IEncoderLocator {
public:
    explicit FixedEncoderLocator(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] std::optional<std::filesystem::path> locate() const override;

private:
    std::filesystem::path path_;
};

/**
 * @brief Searches the usual places, first hit wins.
 *
 * @details Order: the explicit path (from `--ffmpeg` or the options
 * file), `$TINYTHIS_FFMPEG`, the managed install under the app data
 * directory, the directory of the running executable, then each entry of
 * `$PATH`. An explicit path that is not executable is logged and skipped.
 */
class SearchEncoderLocator final : public IEncoderLocator {
public:
    static constexpr const char* kExecutableName = "ffmpeg";

    explicit SearchEncoderLocator(std::optional<std::filesystem::path> explicit_path = std::nullopt)
        : explicit_path_(std::move(explicit_path)) {}

    [[nodiscard]] std::optional<std::filesystem::path> locate() const override;

    /// Every location locate() would probe, in order.
    [[nodiscard]] std::vector<std::filesystem::path> candidates() const;

private:
    std::optional<std::filesystem::path> explicit_path_;
};

} // namespace tinythis

#endif // TINYTHIS_ENCODER_LOCATOR_HPP
