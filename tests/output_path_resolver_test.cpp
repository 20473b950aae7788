#include "../libtinythis/include/output_path_resolver.hpp"
#include "../libtinythis/include/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace tinythis;
using tinythis::test::TempDir;

namespace fs = std::filesystem;

TEST(OutputPathResolver, FirstCandidateIsTaggedWithPreset) {
    TempDir dir;
    const auto input = dir.touch("a.mp4");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Balanced), dir.path() / "a.tinythis.balanced.mp4");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Quality), dir.path() / "a.tinythis.quality.mp4");
}

TEST(OutputPathResolver, ContainerIsAlwaysMp4) {
    TempDir dir;
    const auto input = dir.touch("b.mov");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Balanced), dir.path() / "b.tinythis.balanced.mp4");
}

TEST(OutputPathResolver, ExistingOutputGetsNumberedSuffix) {
    TempDir dir;
    const auto input = dir.touch("a.mp4");
    dir.touch("a.tinythis.speed.mp4");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Speed), dir.path() / "a.tinythis.speed.2.mp4");
}

TEST(OutputPathResolver, ResolvingAgainAfterCreatingTheFileMovesOn) {
    TempDir dir;
    const auto input = dir.touch("clip.avi");

    for (int i = 0; i < 4; ++i) {
        const fs::path out = OutputPathResolver::resolve(input, Preset::Quality);
        EXPECT_FALSE(fs::exists(out));
        std::ofstream(out) << "x";
    }
    EXPECT_TRUE(fs::exists(dir.path() / "clip.tinythis.quality.mp4"));
    EXPECT_TRUE(fs::exists(dir.path() / "clip.tinythis.quality.2.mp4"));
    EXPECT_TRUE(fs::exists(dir.path() / "clip.tinythis.quality.4.mp4"));
}

TEST(OutputPathResolver, FillsTheFirstGap) {
    TempDir dir;
    const auto input = dir.touch("a.mp4");
    dir.touch("a.tinythis.balanced.mp4");
    dir.touch("a.tinythis.balanced.3.mp4");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Balanced), dir.path() / "a.tinythis.balanced.2.mp4");
}

TEST(OutputPathResolver, DanglingSymlinkCountsAsTaken) {
    TempDir dir;
    const auto input = dir.touch("a.mp4");
    fs::create_symlink(dir.path() / "missing-target", dir.path() / "a.tinythis.balanced.mp4");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Balanced), dir.path() / "a.tinythis.balanced.2.mp4");
}

TEST(OutputPathResolver, StemWithDotsIsKept) {
    TempDir dir;
    const auto input = dir.touch("holiday.2024.webm");
    EXPECT_EQ(OutputPathResolver::resolve(input, Preset::Speed),
              dir.path() / "holiday.2024.tinythis.speed.mp4");
}

TEST(OutputPathResolver, BareFileNameResolvesInCurrentDirectory) {
    EXPECT_EQ(OutputPathResolver::first_candidate("clip.mov", Preset::Balanced),
              fs::path(".") / "clip.tinythis.balanced.mp4");
}

TEST(OutputPathResolver, EmptyNameThrows) {
    EXPECT_THROW((void)OutputPathResolver::resolve("/tmp/", Preset::Balanced), FilesystemError);
}
