#include "../libtinythis/include/preset_table.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace tinythis;

namespace {

    constexpr Preset kPresets[] = {Preset::Quality, Preset::Balanced, Preset::Speed};
    constexpr AcceleratorMode kModes[] = {AcceleratorMode::Cpu, AcceleratorMode::Gpu};

    bool contains_pair(const std::vector<std::string>& args, const std::string& key, const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == key && args[i + 1] == value) return true;
        }
        return false;
    }

} // namespace

TEST(PresetTable, EveryCombinationHasArguments) {
    for (const auto p : kPresets) {
        for (const auto m : kModes) {
            const auto profile = PresetTable::arguments_for(p, m);
            EXPECT_FALSE(profile.video_args.empty()) << to_string(p) << "/" << to_string(m);
            EXPECT_FALSE(profile.audio_args.empty()) << to_string(p) << "/" << to_string(m);
            EXPECT_EQ(profile.container_extension, ".mp4");
            EXPECT_EQ(profile.preset, p);
            EXPECT_EQ(profile.accelerator, m);
        }
    }
}

TEST(PresetTable, LookupIsDeterministic) {
    for (const auto p : kPresets) {
        for (const auto m : kModes) {
            EXPECT_EQ(PresetTable::arguments_for(p, m).arguments(),
                      PresetTable::arguments_for(p, m).arguments());
        }
    }
}

TEST(PresetTable, CpuUsesLibx264WithDecreasingQuality) {
    const auto quality = PresetTable::arguments_for(Preset::Quality, AcceleratorMode::Cpu).arguments();
    const auto balanced = PresetTable::arguments_for(Preset::Balanced, AcceleratorMode::Cpu).arguments();
    const auto speed = PresetTable::arguments_for(Preset::Speed, AcceleratorMode::Cpu).arguments();

    EXPECT_TRUE(contains_pair(quality, "-c:v", "libx264"));
    EXPECT_TRUE(contains_pair(quality, "-crf", "18"));
    EXPECT_TRUE(contains_pair(balanced, "-crf", "23"));
    EXPECT_TRUE(contains_pair(speed, "-crf", "28"));
    EXPECT_TRUE(contains_pair(speed, "-preset", "veryfast"));
}

TEST(PresetTable, GpuUsesNvenc) {
    const auto profile = PresetTable::arguments_for(Preset::Balanced, AcceleratorMode::Gpu);
    EXPECT_EQ(profile.video_codec, "h264_nvenc");
    EXPECT_TRUE(contains_pair(profile.arguments(), "-c:v", "h264_nvenc"));
    EXPECT_TRUE(contains_pair(profile.arguments(), "-cq", "24"));
}

TEST(PresetTable, AudioBitrateFollowsPresetNotAccelerator) {
    for (const auto p : kPresets) {
        const auto cpu = PresetTable::arguments_for(p, AcceleratorMode::Cpu);
        const auto gpu = PresetTable::arguments_for(p, AcceleratorMode::Gpu);
        EXPECT_TRUE(std::equal(cpu.audio_args.begin(), cpu.audio_args.end(),
                               gpu.audio_args.begin(), gpu.audio_args.end()));
    }
    EXPECT_TRUE(contains_pair(PresetTable::arguments_for(Preset::Quality, AcceleratorMode::Cpu).arguments(),
                              "-b:a", "160k"));
    EXPECT_TRUE(contains_pair(PresetTable::arguments_for(Preset::Speed, AcceleratorMode::Cpu).arguments(),
                              "-b:a", "96k"));
}

TEST(PresetTable, CommandPutsInputFirstAndOutputLast) {
    const auto profile = PresetTable::arguments_for(Preset::Speed, AcceleratorMode::Cpu);
    const auto args = PresetTable::build_command(profile, "/in/clip.mov", "/in/clip.tinythis.speed.mp4");

    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.back(), "/in/clip.tinythis.speed.mp4");
    EXPECT_TRUE(contains_pair(args, "-i", "/in/clip.mov"));
    EXPECT_TRUE(contains_pair(args, "-progress", "pipe:1"));
    EXPECT_NE(std::find(args.begin(), args.end(), "-nostdin"), args.end());

    const auto input_at = std::find(args.begin(), args.end(), "-i");
    const auto codec_at = std::find(args.begin(), args.end(), "-c:v");
    EXPECT_LT(input_at, codec_at);
}

TEST(Preset, ParseIgnoresCase) {
    EXPECT_EQ(parse_preset("quality"), Preset::Quality);
    EXPECT_EQ(parse_preset("BALANCED"), Preset::Balanced);
    EXPECT_EQ(parse_preset("Speed"), Preset::Speed);
    EXPECT_FALSE(parse_preset("fast").has_value());
    EXPECT_FALSE(parse_preset("").has_value());
}

TEST(Preset, CyclingWrapsBothWays) {
    for (const auto p : kPresets) {
        EXPECT_EQ(prev_preset(next_preset(p)), p);
        EXPECT_EQ(next_preset(next_preset(next_preset(p))), p);
    }
    EXPECT_EQ(next_preset(Preset::Speed), Preset::Quality);
    EXPECT_EQ(prev_preset(Preset::Quality), Preset::Speed);
    EXPECT_EQ(toggled(AcceleratorMode::Cpu), AcceleratorMode::Gpu);
    EXPECT_EQ(kDefaultPreset, Preset::Balanced);
}
