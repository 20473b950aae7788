#include "../../include/preset_table.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace tinythis {

namespace {

    constexpr std::string_view kContainerExtension = ".mp4";

    // libx264, CRF rate control
    constexpr std::array<std::string_view, 10> kCpuQuality = {
        "-c:v", "libx264", "-preset", "slow", "-crf", "18",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };
    constexpr std::array<std::string_view, 10> kCpuBalanced = {
        "-c:v", "libx264", "-preset", "medium", "-crf", "23",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };
    constexpr std::array<std::string_view, 10> kCpuSpeed = {
        "-c:v", "libx264", "-preset", "veryfast", "-crf", "28",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };

    // h264_nvenc, constant-quality VBR. p1 is the fastest nvenc preset, p7 the slowest.
    constexpr std::array<std::string_view, 16> kGpuQuality = {
        "-c:v", "h264_nvenc", "-preset", "p6", "-tune", "hq",
        "-rc", "vbr", "-cq", "19", "-b:v", "0",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };
    constexpr std::array<std::string_view, 16> kGpuBalanced = {
        "-c:v", "h264_nvenc", "-preset", "p5", "-tune", "hq",
        "-rc", "vbr", "-cq", "24", "-b:v", "0",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };
    constexpr std::array<std::string_view, 16> kGpuSpeed = {
        "-c:v", "h264_nvenc", "-preset", "p2", "-tune", "hq",
        "-rc", "vbr", "-cq", "29", "-b:v", "0",
        "-pix_fmt", "yuv420p", "-movflags", "+faststart"
    };

    constexpr std::array<std::string_view, 4> kAudioQuality  = {"-c:a", "aac", "-b:a", "160k"};
    constexpr std::array<std::string_view, 4> kAudioBalanced = {"-c:a", "aac", "-b:a", "128k"};
    constexpr std::array<std::string_view, 4> kAudioSpeed    = {"-c:a", "aac", "-b:a", "96k"};

    std::span<const std::string_view> audio_for(const Preset preset) noexcept {
        switch (preset) {
            case Preset::Quality: return kAudioQuality;
            case Preset::Speed:   return kAudioSpeed;
            case Preset::Balanced: break;
        }
        return kAudioBalanced;
    }

    std::span<const std::string_view> video_for(const Preset preset, const AcceleratorMode accelerator) noexcept {
        if (accelerator == AcceleratorMode::Gpu) {
            switch (preset) {
                case Preset::Quality: return kGpuQuality;
                case Preset::Speed:   return kGpuSpeed;
                case Preset::Balanced: break;
            }
            return kGpuBalanced;
        }
        switch (preset) {
            case Preset::Quality: return kCpuQuality;
            case Preset::Speed:   return kCpuSpeed;
            case Preset::Balanced: break;
        }
        return kCpuBalanced;
    }

} // namespace

std::optional<Preset> parse_preset(const std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto preset : {Preset::Quality, Preset::Balanced, Preset::Speed}) {
        if (lower == to_string(preset)) {
            return preset;
        }
    }
    return std::nullopt;
}

std::vector<std::string> EncodeProfile::arguments() const {
    std::vector<std::string> out;
    out.reserve(video_args.size() + audio_args.size());
    for (const auto arg : video_args) out.emplace_back(arg);
    for (const auto arg : audio_args) out.emplace_back(arg);
    return out;
}

EncodeProfile PresetTable::arguments_for(const Preset preset, const AcceleratorMode accelerator) noexcept {
    EncodeProfile profile;
    profile.preset = preset;
    profile.accelerator = accelerator;
    profile.video_codec = accelerator == AcceleratorMode::Gpu ? "h264_nvenc" : "libx264";
    profile.video_args = video_for(preset, accelerator);
    profile.audio_args = audio_for(preset);
    profile.container_extension = kContainerExtension;
    return profile;
}

std::vector<std::string> PresetTable::build_command(const EncodeProfile& profile,
                                                    const std::filesystem::path& input,
                                                    const std::filesystem::path& output) {
    std::vector<std::string> args = {
        "-hide_banner", "-nostdin", "-nostats", "-y",
        "-i", input.string(),
        "-map", "0:v:0",
        "-map", "0:a?"
    };
    for (auto& arg : profile.arguments()) {
        args.push_back(std::move(arg));
    }
    // key=value progress blocks on stdout, diagnostics stay on stderr
    args.emplace_back("-progress");
    args.emplace_back("pipe:1");
    args.push_back(output.string());
    return args;
}

} // namespace tinythis
