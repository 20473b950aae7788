#include "../../include/input_file.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace tinythis {

namespace {

    constexpr std::array<std::string_view, 10> kExtensions = {
        ".mp4", ".mov", ".avi", ".webm", ".ogv",
        ".asx", ".mpeg", ".m4v", ".wmv", ".mpg"
    };

    std::string lower_extension(const fs::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

} // namespace

std::span<const std::string_view> supported_extensions() noexcept {
    return kExtensions;
}

bool is_supported_video(const fs::path& path) {
    const std::string ext = lower_extension(path);
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

InputFile InputFile::validate(const fs::path& path) {
    if (!is_supported_video(path)) {
        throw ValidationError(ValidationError::Reason::UnsupportedExtension, path,
                              "unsupported input extension: " + path.string());
    }

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        throw ValidationError(ValidationError::Reason::NotFound, path,
                              "input not found: " + path.string());
    }
    if (!fs::is_regular_file(st)) {
        throw ValidationError(ValidationError::Reason::NotAFile, path,
                              "input is not a regular file: " + path.string());
    }

    InputFile file;
    file.path = fs::absolute(path, ec).lexically_normal();
    if (ec) {
        file.path = path;
    }
    file.extension = lower_extension(path);
    file.size_bytes = fs::file_size(path, ec);
    if (ec) {
        file.size_bytes = 0;
    }
    return file;
}

} // namespace tinythis
