#include "../../include/encoder_locator.hpp"
#include "../../include/app_paths.hpp"
#include "../../include/logger.hpp"

#include <cstdlib>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace tinythis {

bool is_executable_file(const fs::path& path) noexcept {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> FixedEncoderLocator::locate() const {
    if (is_executable_file(path_)) {
        return path_;
    }
    Logger::log(LogLevel::Debug, "encoder not executable: " + path_.string(), "locator");
    return std::nullopt;
}

std::vector<fs::path> SearchEncoderLocator::candidates() const {
    std::vector<fs::path> out;
    if (explicit_path_ && !explicit_path_->empty()) {
        out.push_back(*explicit_path_);
    }
    if (const char* env = std::getenv("TINYTHIS_FFMPEG"); env != nullptr && *env != '\0') {
        out.emplace_back(env);
    }
    if (auto managed = managed_encoder_path()) {
        out.push_back(std::move(*managed));
    }
    if (auto dir = executable_dir()) {
        out.push_back(*dir / kExecutableName);
    }
    if (const char* path_env = std::getenv("PATH"); path_env != nullptr) {
        std::string_view rest(path_env);
        while (!rest.empty()) {
            const auto sep = rest.find(':');
            const std::string_view entry = rest.substr(0, sep);
            // an empty PATH entry means the current directory
            out.push_back(fs::path(entry.empty() ? "." : std::string(entry)) / kExecutableName);
            if (sep == std::string_view::npos) break;
            rest.remove_prefix(sep + 1);
        }
    }
    return out;
}

std::optional<fs::path> SearchEncoderLocator::locate() const {
    for (const auto& candidate : candidates()) {
        if (is_executable_file(candidate)) {
            Logger::log(LogLevel::Debug, "encoder found: " + candidate.string(), "locator");
            return candidate;
        }
        if (explicit_path_ && candidate == *explicit_path_) {
            Logger::log(LogLevel::Warning, "configured encoder is not executable: " + candidate.string(), "locator");
        }
    }
    Logger::log(LogLevel::Debug, "no encoder found", "locator");
    return std::nullopt;
}

} // namespace tinythis
