#ifndef TINYTHIS_CLI_PARSER_HPP
#define TINYTHIS_CLI_PARSER_HPP

#include "../../../libtinythis/include/preset.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool gpu = false;
    bool cpu = false;

    tinythis::Preset mode = tinythis::kDefaultPreset;
    bool mode_given = false;  ///< --mode appeared on the command line or in the options file
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path ffmpeg;
    std::filesystem::path config_path;

    /// Raw positionals: an optional leading preset name, then files.
    std::vector<std::string> positionals;

    // filled by the parse callback
    tinythis::Preset preset = tinythis::kDefaultPreset;
    std::vector<std::filesystem::path> inputs;

    /// --cpu wins over --gpu, so a persisted `gpu = true` can be overridden once.
    [[nodiscard]] tinythis::AcceleratorMode accelerator() const {
        return gpu && !cpu ? tinythis::AcceleratorMode::Gpu : tinythis::AcceleratorMode::Cpu;
    }

    /// No input files means the interactive session.
    [[nodiscard]] bool interactive() const { return inputs.empty(); }
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 *
 * The options file (`--config`, default `<app data>/options.toml`) is
 * read by CLI11 as TOML; its `gpu`, `ffmpeg` and `log-level` keys map to
 * the options of the same name.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Splits positionals into an optional leading preset and files.
 *
 * The first positional is taken as the preset when it names one and no
 * file of that name exists. Naming a preset both positionally and with
 * `--mode` is accepted only if they agree.
 * @throws CLI::ValidationError on conflicting presets.
 */
void resolve_positionals(Settings& settings);

#endif // TINYTHIS_CLI_PARSER_HPP
