#include "../libtinythis/include/session_controller.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace tinythis;
using tinythis::test::TempDir;
using tinythis::test::write_stub_encoder;

namespace fs = std::filesystem;

namespace {

    constexpr QueueOptions kFastCancel{std::chrono::milliseconds(500)};

    /// Ticks until the session leaves Compressing.
    bool tick_until_browsing(SessionController& session,
                             const std::chrono::seconds timeout = std::chrono::seconds(20)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (session.state().mode == SessionMode::Compressing) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            session.tick(std::chrono::milliseconds(50));
        }
        return true;
    }

    class SessionControllerTest : public ::testing::Test {
    protected:
        void use_encoder(const std::string& body) {
            locator = std::make_unique<FixedEncoderLocator>(write_stub_encoder(dir.path(), "ffmpeg", body));
            queue = std::make_unique<JobQueue>(*locator, bus, kFastCancel);
            session = std::make_unique<SessionController>(*queue);
        }

        void TearDown() override {
            session.reset();
            queue.reset();
        }

        TempDir dir;
        EventBus bus;
        std::unique_ptr<FixedEncoderLocator> locator;
        std::unique_ptr<JobQueue> queue;
        std::unique_ptr<SessionController> session;
    };

} // namespace

TEST_F(SessionControllerTest, StartsBrowsingWithDefaults) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    const SessionState& s = session->state();
    EXPECT_EQ(s.mode, SessionMode::Browsing);
    EXPECT_EQ(s.preset, Preset::Balanced);
    EXPECT_EQ(s.accelerator, AcceleratorMode::Cpu);
    EXPECT_TRUE(s.jobs.empty());
    EXPECT_FALSE(s.selection.has_value());
    EXPECT_FALSE(s.quit);
}

TEST_F(SessionControllerTest, AddFilesCountsRejections) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    const auto a = dir.touch("a.mp4");
    const auto report = session->add_files({a, dir.touch("b.mov"), dir.touch("notes.txt"),
                                            dir.path() / "gone.mp4", a});

    EXPECT_EQ(report.added, 2u);
    EXPECT_EQ(report.unsupported, 1u);
    EXPECT_EQ(report.invalid, 1u);
    EXPECT_EQ(report.duplicate, 1u);
    EXPECT_EQ(report.describe(), "added 2 files, ignored 1 unsupported, ignored 1 invalid, ignored 1 duplicate");
    EXPECT_EQ(session->state().banner, report.describe());
    EXPECT_EQ(session->state().jobs.size(), 2u);
    EXPECT_EQ(session->state().selection, 0u);
}

TEST_F(SessionControllerTest, RejectedFileLeavesQueueLength) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4")});
    const auto report = session->add_files({dir.touch("a.txt")});
    EXPECT_EQ(report.added, 0u);
    EXPECT_EQ(report.unsupported, 1u);
    EXPECT_EQ(session->state().jobs.size(), 1u);
}

TEST_F(SessionControllerTest, EmptyReportSaysSo) {
    EXPECT_EQ(AddFilesReport{}.describe(), "no files");
    EXPECT_EQ((AddFilesReport{1, 0, 0, 0}).describe(), "added 1 file");
}

TEST_F(SessionControllerTest, PresetAppliesToFilesAddedAfterwards) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4")});
    EXPECT_TRUE(session->handle(SessionEvent::PresetNext));
    EXPECT_EQ(session->state().preset, Preset::Speed);
    session->add_files({dir.touch("b.mp4")});
    EXPECT_TRUE(session->handle(SessionEvent::PresetPrev));
    EXPECT_TRUE(session->handle(SessionEvent::PresetPrev));
    EXPECT_EQ(session->state().preset, Preset::Quality);

    const auto& jobs = session->state().jobs;
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].preset, Preset::Balanced);
    EXPECT_EQ(jobs[1].preset, Preset::Speed);
}

TEST_F(SessionControllerTest, ToggleNotifiesListener) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    std::vector<AcceleratorMode> seen;
    session->set_accelerator_listener([&seen](const AcceleratorMode m) { seen.push_back(m); });

    EXPECT_TRUE(session->handle(SessionEvent::ToggleAccelerator));
    EXPECT_TRUE(session->handle(SessionEvent::ToggleAccelerator));
    EXPECT_EQ(seen, (std::vector<AcceleratorMode>{AcceleratorMode::Gpu, AcceleratorMode::Cpu}));
    EXPECT_EQ(session->state().banner, "accelerator: cpu");
}

TEST_F(SessionControllerTest, SelectionStaysInRange) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    EXPECT_FALSE(session->handle(SessionEvent::SelectNext));
    session->add_files({dir.touch("a.mp4"), dir.touch("b.mp4"), dir.touch("c.mp4")});

    EXPECT_FALSE(session->handle(SessionEvent::SelectPrev));
    EXPECT_TRUE(session->handle(SessionEvent::SelectNext));
    EXPECT_TRUE(session->handle(SessionEvent::SelectNext));
    EXPECT_FALSE(session->handle(SessionEvent::SelectNext));
    EXPECT_EQ(session->state().selection, 2u);
}

TEST_F(SessionControllerTest, RemoveKeepsOrderAndClampsSelection) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4"), dir.touch("b.mp4"), dir.touch("c.mp4")});
    session->handle(SessionEvent::SelectNext);
    session->handle(SessionEvent::SelectNext);

    EXPECT_TRUE(session->handle(SessionEvent::RemoveSelected));
    ASSERT_EQ(session->state().jobs.size(), 2u);
    EXPECT_EQ(session->state().jobs[0].input.filename(), "a.mp4");
    EXPECT_EQ(session->state().jobs[1].input.filename(), "b.mp4");
    EXPECT_EQ(session->state().selection, 1u);

    session->handle(SessionEvent::SelectPrev);
    EXPECT_TRUE(session->handle(SessionEvent::RemoveSelected));
    ASSERT_EQ(session->state().jobs.size(), 1u);
    EXPECT_EQ(session->state().jobs[0].input.filename(), "b.mp4");
    EXPECT_EQ(session->state().selection, 0u);

    EXPECT_TRUE(session->handle(SessionEvent::RemoveSelected));
    EXPECT_TRUE(session->state().jobs.empty());
    EXPECT_FALSE(session->state().selection.has_value());
    EXPECT_FALSE(session->handle(SessionEvent::RemoveSelected));
}

TEST_F(SessionControllerTest, RunWithNothingPendingStaysBrowsing) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    EXPECT_TRUE(session->handle(SessionEvent::Run));
    EXPECT_EQ(session->state().mode, SessionMode::Browsing);
    EXPECT_EQ(session->state().banner, "nothing to compress");
}

TEST_F(SessionControllerTest, RunDrainsQueueAndSummarizes) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4"), dir.touch("b.mov")});

    EXPECT_TRUE(session->handle(SessionEvent::Run));
    EXPECT_EQ(session->state().mode, SessionMode::Compressing);
    EXPECT_FALSE(session->handle(SessionEvent::Run));
    ASSERT_TRUE(tick_until_browsing(*session));

    const SessionState& s = session->state();
    ASSERT_TRUE(s.last_summary.has_value());
    EXPECT_EQ(s.last_summary->succeeded, 2u);
    EXPECT_EQ(s.banner, "done: 2 succeeded, 0 failed, 0 cancelled");
    EXPECT_TRUE(fs::exists(dir.path() / "a.tinythis.balanced.mp4"));
    EXPECT_TRUE(fs::exists(dir.path() / "b.tinythis.balanced.mp4"));
}

TEST_F(SessionControllerTest, CancelReturnsToBrowsingAndKeepsPending) {
    use_encoder(tinythis::test::kSleepingEncoder);
    session->add_files({dir.touch("a.mp4"), dir.touch("b.mp4")});

    ASSERT_TRUE(session->handle(SessionEvent::Run));
    ASSERT_EQ(session->state().mode, SessionMode::Compressing);
    const auto out = session->state().jobs[0].output_path;
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(tinythis::test::wait_until([&out] { return fs::exists(*out); }));

    EXPECT_TRUE(session->handle(SessionEvent::Cancel));
    const SessionState& s = session->state();
    EXPECT_EQ(s.mode, SessionMode::Browsing);
    EXPECT_EQ(s.jobs[0].state, JobState::Cancelled);
    EXPECT_EQ(s.jobs[1].state, JobState::Pending);
    EXPECT_EQ(s.banner, "cancelled, 1 file still queued");
    EXPECT_FALSE(fs::exists(*out));
}

TEST_F(SessionControllerTest, QuitWhileCompressingCancels) {
    use_encoder(tinythis::test::kSleepingEncoder);
    session->add_files({dir.touch("a.mp4")});
    ASSERT_TRUE(session->handle(SessionEvent::Run));

    EXPECT_TRUE(session->handle(SessionEvent::Quit));
    EXPECT_TRUE(session->state().quit);
    EXPECT_EQ(session->state().jobs[0].state, JobState::Cancelled);
}

TEST_F(SessionControllerTest, MissingEncoderReturnsToBrowsing) {
    locator = std::make_unique<FixedEncoderLocator>(dir.path() / "no-ffmpeg");
    queue = std::make_unique<JobQueue>(*locator, bus, kFastCancel);
    session = std::make_unique<SessionController>(*queue);
    session->add_files({dir.touch("a.mp4")});

    EXPECT_TRUE(session->handle(SessionEvent::Run));
    EXPECT_EQ(session->state().mode, SessionMode::Browsing);
    EXPECT_NE(session->state().banner.find("no encoder"), std::string::npos);
    EXPECT_EQ(session->state().jobs[0].state, JobState::Pending);
}

TEST_F(SessionControllerTest, FailedJobCanBeRetried) {
    use_encoder(tinythis::test::kFailingEncoder);
    session->add_files({dir.touch("a.mp4")});
    session->handle(SessionEvent::Run);
    ASSERT_TRUE(tick_until_browsing(*session));
    EXPECT_EQ(session->state().banner, "done: 0 succeeded, 1 failed, 0 cancelled");

    EXPECT_TRUE(session->handle(SessionEvent::RetrySelected));
    ASSERT_EQ(session->state().jobs.size(), 2u);
    EXPECT_EQ(session->state().jobs[1].state, JobState::Pending);

    // retrying a pending job is refused with a message
    session->handle(SessionEvent::SelectNext);
    EXPECT_TRUE(session->handle(SessionEvent::RetrySelected));
    EXPECT_EQ(session->state().jobs.size(), 2u);
    EXPECT_NE(session->state().banner.find("only failed or cancelled"), std::string::npos);
}

TEST_F(SessionControllerTest, RemovingARunningJobIsRefused) {
    use_encoder(tinythis::test::kSleepingEncoder);
    session->add_files({dir.touch("a.mp4")});
    session->handle(SessionEvent::Run);

    EXPECT_TRUE(session->handle(SessionEvent::RemoveSelected));
    EXPECT_EQ(session->state().jobs.size(), 1u);
    EXPECT_NE(session->state().banner.find("only pending"), std::string::npos);
    session->handle(SessionEvent::Cancel);
}

TEST_F(SessionControllerTest, BackClearsTheBanner) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4")});
    EXPECT_TRUE(session->handle(SessionEvent::Back));
    EXPECT_TRUE(session->state().banner.empty());
    EXPECT_FALSE(session->handle(SessionEvent::Back));
}

TEST_F(SessionControllerTest, ClearFinishedKeepsPendingRows) {
    use_encoder(tinythis::test::kSucceedingEncoder);
    session->add_files({dir.touch("a.mp4"), dir.touch("b.mp4")});
    ASSERT_TRUE(session->handle(SessionEvent::Run));
    ASSERT_TRUE(tick_until_browsing(*session));

    session->add_files({dir.touch("c.mp4")});
    session->handle(SessionEvent::SelectNext);
    session->handle(SessionEvent::SelectNext);
    ASSERT_EQ(session->state().selection, 2u);

    EXPECT_TRUE(session->handle(SessionEvent::ClearFinished));
    const SessionState& s = session->state();
    ASSERT_EQ(s.jobs.size(), 1u);
    EXPECT_EQ(s.jobs[0].input.filename(), "c.mp4");
    EXPECT_EQ(s.jobs[0].state, JobState::Pending);
    EXPECT_EQ(s.selection, 0u);
    EXPECT_EQ(s.banner, "cleared 2 finished files");

    // nothing left to clear
    EXPECT_FALSE(session->handle(SessionEvent::ClearFinished));
}

TEST_F(SessionControllerTest, SecondBackClearsFinishedRows) {
    use_encoder(tinythis::test::kFailingEncoder);
    session->add_files({dir.touch("a.mp4")});
    ASSERT_TRUE(session->handle(SessionEvent::Run));
    ASSERT_TRUE(tick_until_browsing(*session));
    ASSERT_EQ(session->state().jobs.size(), 1u);

    EXPECT_TRUE(session->handle(SessionEvent::Back));
    EXPECT_EQ(session->state().jobs.size(), 1u);
    EXPECT_TRUE(session->handle(SessionEvent::Back));
    EXPECT_TRUE(session->state().jobs.empty());
    EXPECT_FALSE(session->state().selection.has_value());
    EXPECT_EQ(session->state().banner, "cleared 1 finished file");
}

TEST_F(SessionControllerTest, ClearFinishedIsIgnoredWhileCompressing) {
    use_encoder(tinythis::test::kSleepingEncoder);
    session->add_files({dir.touch("a.mp4")});
    ASSERT_TRUE(session->handle(SessionEvent::Run));
    EXPECT_FALSE(session->handle(SessionEvent::ClearFinished));
    EXPECT_EQ(session->state().jobs.size(), 1u);
    session->handle(SessionEvent::Cancel);
}
