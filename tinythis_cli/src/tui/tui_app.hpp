#ifndef TINYTHIS_TUI_APP_HPP
#define TINYTHIS_TUI_APP_HPP

#include "../../../libtinythis/include/encoder_locator.hpp"
#include "../../../libtinythis/include/preset.hpp"
#include <atomic>
#include <filesystem>
#include <optional>

struct TuiOptions {
    tinythis::Preset preset = tinythis::kDefaultPreset;
    tinythis::AcceleratorMode accelerator = tinythis::AcceleratorMode::Cpu;
    std::optional<std::filesystem::path> options_file;  ///< Where accelerator toggles are saved
    bool use_colors = true;
};

/**
 * @brief Runs the interactive session until the user quits.
 * @param stop Set asynchronously (e.g. by SIGTERM) to quit as if `q` was pressed.
 * @return Process exit code.
 * @throws std::system_error if the terminal cannot be set up.
 */
int run_tui(const tinythis::IEncoderLocator& locator, const TuiOptions& options, const std::atomic<bool>& stop);

#endif // TINYTHIS_TUI_APP_HPP
