#ifndef TINYTHIS_APP_PATHS_HPP
#define TINYTHIS_APP_PATHS_HPP

#include <filesystem>
#include <optional>

namespace tinythis {

/**
 * @brief Per-user data directory.
 *
 * `$TINYTHIS_HOME` if set, else `$XDG_DATA_HOME/tinythis`, else
 * `$HOME/.local/share/tinythis`. The directory is not created.
 * @return std::nullopt if none of the variables is usable.
 */
[[nodiscard]] std::optional<std::filesystem::path> app_data_dir();

/// `<app data>/ffmpeg/ffmpeg`, where a managed encoder would be installed.
[[nodiscard]] std::optional<std::filesystem::path> managed_encoder_path();

/// `<app data>/options.toml`.
[[nodiscard]] std::optional<std::filesystem::path> default_options_path();

/// `<app data>/tinythis.log`.
[[nodiscard]] std::optional<std::filesystem::path> default_log_path();

/// Directory of the running executable, from /proc/self/exe.
[[nodiscard]] std::optional<std::filesystem::path> executable_dir();

} // namespace tinythis

#endif // TINYTHIS_APP_PATHS_HPP
