/**
 * @file preset_table.hpp
 * @brief Static mapping from (preset, accelerator) to encoder arguments.
 */

#ifndef TINYTHIS_PRESET_TABLE_HPP
#define TINYTHIS_PRESET_TABLE_HPP

#include "preset.hpp"
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tinythis {

/**
 * @brief The encoder arguments of one (preset, accelerator) pair.
 *
 * All views point into static storage owned by PresetTable, so a profile
 * can be copied freely and compared element-wise.
 */
struct EncodeProfile {
    Preset preset = kDefaultPreset;
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
    std::string_view video_codec;                  ///< "libx264" or "h264_nvenc"
    std::span<const std::string_view> video_args;  ///< Codec, rate control and tuning
    std::span<const std::string_view> audio_args;  ///< AAC at the preset's bitrate
    std::string_view container_extension;          ///< Always ".mp4"

    /// Video followed by audio arguments, as owned strings.
    [[nodiscard]] std::vector<std::string> arguments() const;
};

/**
 * @brief Lookup of the six fixed encoder profiles.
 *
 * The table is total over Preset x AcceleratorMode and has no state;
 * the same inputs always produce an identical profile.
 */
class PresetTable {
public:
    [[nodiscard]] static EncodeProfile arguments_for(Preset preset, AcceleratorMode accelerator) noexcept;

    /**
     * @brief Builds the complete encoder command line (without argv[0]).
     *
     * Global flags and the input come first, then the profile, then the
     * progress channel request. The output path is always the last element.
     */
    [[nodiscard]] static std::vector<std::string> build_command(const EncodeProfile& profile,
                                                                const std::filesystem::path& input,
                                                                const std::filesystem::path& output);
};

} // namespace tinythis

#endif // TINYTHIS_PRESET_TABLE_HPP
