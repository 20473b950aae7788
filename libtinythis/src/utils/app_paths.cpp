#include "../../include/app_paths.hpp"

#include <cstdlib>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace tinythis {

namespace {

    std::optional<fs::path> env_path(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return fs::path(value);
    }

} // namespace

std::optional<fs::path> app_data_dir() {
    if (auto home = env_path("TINYTHIS_HOME")) {
        return home;
    }
    if (auto xdg = env_path("XDG_DATA_HOME"); xdg && xdg->is_absolute()) {
        return *xdg / "tinythis";
    }
    if (auto home = env_path("HOME")) {
        return *home / ".local" / "share" / "tinythis";
    }
    return std::nullopt;
}

std::optional<fs::path> managed_encoder_path() {
    const auto dir = app_data_dir();
    if (!dir) return std::nullopt;
    return *dir / "ffmpeg" / "ffmpeg";
}

std::optional<fs::path> default_options_path() {
    const auto dir = app_data_dir();
    if (!dir) return std::nullopt;
    return *dir / "options.toml";
}

std::optional<fs::path> default_log_path() {
    const auto dir = app_data_dir();
    if (!dir) return std::nullopt;
    return *dir / "tinythis.log";
}

std::optional<fs::path> executable_dir() {
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
}

} // namespace tinythis
