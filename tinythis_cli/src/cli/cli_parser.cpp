#include "cli_parser.hpp"
#include "../../../libtinythis/include/app_paths.hpp"
#include <CLI/CLI.hpp>
#include <map>

namespace fs = std::filesystem;

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", TINYTHIS_VERSION);

    const auto default_config = tinythis::default_options_path();
    app.set_config("--config",
                   default_config ? default_config->string() : std::string("options.toml"),
                   "Options file (TOML).");

    // --- Flags (booleans) ---
    app.add_flag("--gpu", settings.gpu,
                 "Use the hardware (NVENC) encoder path.");

    app.add_flag("--cpu", settings.cpu,
                 "Use the software (libx264) encoder path, overriding --gpu.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    auto* mode_opt = app.add_option("--mode", settings.mode, "Preset: quality, balanced (default) or speed.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, tinythis::Preset>{
                {"quality", tinythis::Preset::Quality},
                {"balanced", tinythis::Preset::Balanced},
                {"speed", tinythis::Preset::Speed}
            }, CLI::ignore_case));

    app.add_option("--ffmpeg", settings.ffmpeg,
                   "Path to the ffmpeg executable (default: search).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->check(CLI::IsMember({"ERROR", "WARN", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file.");

    // --- Positional Arguments ---
    app.add_option("files", settings.positionals,
                   "[preset] file... ; without files the interactive session starts.");

    // --- Cross-validation logic ---
    app.callback([&settings, &app, mode_opt, default_config]() {
        settings.mode_given = mode_opt->count() > 0;
        if (const auto* opt = app.get_option_no_throw("--config"); opt != nullptr && opt->count() > 0) {
            settings.config_path = opt->as<std::string>();
        } else if (default_config) {
            settings.config_path = *default_config;
        }
        resolve_positionals(settings);
    });
}

void resolve_positionals(Settings& settings) {
    settings.inputs.clear();
    settings.preset = settings.mode_given ? settings.mode : tinythis::kDefaultPreset;

    size_t first_file = 0;
    if (!settings.positionals.empty()) {
        const std::string& head = settings.positionals.front();
        std::error_code ec;
        if (const auto p = tinythis::parse_preset(head); p && !fs::exists(head, ec)) {
            if (settings.mode_given && settings.mode != *p) {
                throw CLI::ValidationError("preset given twice: '" + head + "' and --mode " +
                                           std::string(tinythis::to_string(settings.mode)));
            }
            settings.preset = *p;
            first_file = 1;
        }
    }
    for (size_t i = first_file; i < settings.positionals.size(); ++i) {
        settings.inputs.emplace_back(settings.positionals[i]);
    }
}
