#ifndef TINYTHIS_OUTPUT_PATH_RESOLVER_HPP
#define TINYTHIS_OUTPUT_PATH_RESOLVER_HPP

#include "preset.hpp"
#include <filesystem>

namespace tinythis {

/**
 * @brief Derives a non-colliding destination for an input file.
 *
 * For `/videos/clip.mov` and Preset::Speed the first candidate is
 * `/videos/clip.tinythis.speed.mp4`, then `clip.tinythis.speed.2.mp4`,
 * `.3.mp4` and so on. The check runs against the filesystem at call time,
 * so callers resolve right before the encoder starts.
 *
 * Writability of the directory is not checked here; an unwritable
 * directory surfaces as a job failure.
 */
class OutputPathResolver {
public:
    /// Highest numbered suffix tried before giving up.
    static constexpr unsigned kMaxSuffix = 9999;

    /**
     * @brief Returns the first candidate that does not exist.
     * @throws FilesystemError if every candidate up to kMaxSuffix is taken
     *         or the input has no file name.
     */
    [[nodiscard]] static std::filesystem::path resolve(const std::filesystem::path& input, Preset preset);

    /// The unnumbered candidate, without any existence check.
    [[nodiscard]] static std::filesystem::path first_candidate(const std::filesystem::path& input, Preset preset);
};

} // namespace tinythis

#endif // TINYTHIS_OUTPUT_PATH_RESOLVER_HPP
