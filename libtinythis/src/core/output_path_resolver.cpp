#include "../../include/output_path_resolver.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace tinythis {

namespace {

    // symlink_status so a dangling link still counts as taken
    bool taken(const fs::path& candidate) {
        std::error_code ec;
        const auto st = fs::symlink_status(candidate, ec);
        return !ec && st.type() != fs::file_type::not_found;
    }

    std::string base_name(const fs::path& input, const Preset preset) {
        return input.stem().string() + ".tinythis." + std::string(to_string(preset));
    }

    fs::path parent_of(const fs::path& input) {
        const auto parent = input.parent_path();
        return parent.empty() ? fs::path(".") : parent;
    }

} // namespace

fs::path OutputPathResolver::first_candidate(const fs::path& input, const Preset preset) {
    return parent_of(input) / (base_name(input, preset) + ".mp4");
}

fs::path OutputPathResolver::resolve(const fs::path& input, const Preset preset) {
    if (input.stem().empty()) {
        throw FilesystemError(input, "missing file stem: " + input.string());
    }

    const fs::path dir = parent_of(input);
    const std::string base = base_name(input, preset);

    fs::path candidate = dir / (base + ".mp4");
    if (!taken(candidate)) {
        return candidate;
    }

    for (unsigned n = 2; n <= kMaxSuffix; ++n) {
        candidate = dir / (base + "." + std::to_string(n) + ".mp4");
        if (!taken(candidate)) {
            Logger::log(LogLevel::Debug, "Output name taken, using " + candidate.filename().string(), "resolver");
            return candidate;
        }
    }

    throw FilesystemError(dir, "no free output name for " + input.filename().string() + " in " + dir.string());
}

} // namespace tinythis
