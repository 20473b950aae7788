#ifndef TINYTHIS_PRESET_HPP
#define TINYTHIS_PRESET_HPP

#include <optional>
#include <string_view>

namespace tinythis {

/**
 * @brief The three fixed quality/size tradeoffs.
 *
 * Ordered by fidelity: Quality keeps the most detail and takes the
 * longest, Speed produces the smallest file fastest.
 */
enum class Preset {
    Quality,
    Balanced,
    Speed
};

/**
 * @brief Whether the encoder runs its software or hardware video path.
 */
enum class AcceleratorMode {
    Cpu,
    Gpu
};

inline constexpr Preset kDefaultPreset = Preset::Balanced;

[[nodiscard]] constexpr std::string_view to_string(const Preset preset) noexcept {
    switch (preset) {
        case Preset::Quality:  return "quality";
        case Preset::Balanced: return "balanced";
        case Preset::Speed:    return "speed";
    }
    return "balanced";
}

[[nodiscard]] constexpr std::string_view to_string(const AcceleratorMode mode) noexcept {
    return mode == AcceleratorMode::Gpu ? "gpu" : "cpu";
}

/// Parses "quality", "balanced" or "speed", ignoring case.
[[nodiscard]] std::optional<Preset> parse_preset(std::string_view name);

/// quality -> balanced -> speed -> quality
[[nodiscard]] constexpr Preset next_preset(const Preset preset) noexcept {
    switch (preset) {
        case Preset::Quality:  return Preset::Balanced;
        case Preset::Balanced: return Preset::Speed;
        case Preset::Speed:    return Preset::Quality;
    }
    return kDefaultPreset;
}

/// quality -> speed -> balanced -> quality
[[nodiscard]] constexpr Preset prev_preset(const Preset preset) noexcept {
    switch (preset) {
        case Preset::Quality:  return Preset::Speed;
        case Preset::Balanced: return Preset::Quality;
        case Preset::Speed:    return Preset::Balanced;
    }
    return kDefaultPreset;
}

[[nodiscard]] constexpr AcceleratorMode toggled(const AcceleratorMode mode) noexcept {
    return mode == AcceleratorMode::Gpu ? AcceleratorMode::Cpu : AcceleratorMode::Gpu;
}

} // namespace tinythis

#endif // TINYTHIS_PRESET_HPP
