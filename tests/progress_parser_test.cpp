#include "../libtinythis/include/progress_parser.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stop_token>

using namespace tinythis;
using tinythis::test::TempDir;

TEST(ProgressParser, ParsesTimestamps) {
    EXPECT_EQ(ProgressParser::parse_timestamp_us("00:00:08.05"), 8'050'000u);
    EXPECT_EQ(ProgressParser::parse_timestamp_us("01:02:03"), 3'723'000'000u);
    EXPECT_EQ(ProgressParser::parse_timestamp_us("00:00:00.123456789"), 123'456u);
    EXPECT_FALSE(ProgressParser::parse_timestamp_us("N/A").has_value());
    EXPECT_FALSE(ProgressParser::parse_timestamp_us("12:34").has_value());
}

TEST(ProgressParser, ParsesDurationLine) {
    EXPECT_EQ(ProgressParser::parse_duration_line("  Duration: 00:00:08.05, start: 0.000000, bitrate: 1205 kb/s"),
              8'050'000u);
    EXPECT_FALSE(ProgressParser::parse_duration_line("  Duration: N/A, bitrate: N/A").has_value());
    EXPECT_FALSE(ProgressParser::parse_duration_line("Stream #0:0: Video: h264").has_value());
}

TEST(ProgressParser, EmitsOneEventPerBlock) {
    ProgressParser parser;
    parser.feed_diagnostic("  Duration: 00:00:10.00, start: 0.000000");
    EXPECT_EQ(parser.total_us(), 10'000'000u);

    EXPECT_FALSE(parser.feed_progress("frame=42").has_value());
    EXPECT_FALSE(parser.feed_progress("out_time_us=2500000").has_value());
    const auto ev = parser.feed_progress("progress=continue");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->frame, 42u);
    EXPECT_EQ(ev->out_time_us, 2'500'000u);
    EXPECT_DOUBLE_EQ(ev->fraction, 0.25);
    EXPECT_FALSE(ev->ended);
}

TEST(ProgressParser, FractionIsMonotonicAndCapped) {
    ProgressParser parser;
    parser.feed_diagnostic("Duration: 00:00:10.00, start: 0.0");

    parser.feed_progress("out_time_us=6000000");
    EXPECT_DOUBLE_EQ(parser.feed_progress("progress=continue")->fraction, 0.6);

    // a timestamp going backwards does not move the bar back
    parser.feed_progress("out_time_us=3000000");
    EXPECT_DOUBLE_EQ(parser.feed_progress("progress=continue")->fraction, 0.6);

    parser.feed_progress("out_time_us=10000000");
    const auto end = parser.feed_progress("progress=end");
    ASSERT_TRUE(end.has_value());
    EXPECT_TRUE(end->ended);
    EXPECT_DOUBLE_EQ(end->fraction, ProgressParser::kMaxRunningFraction);
}

TEST(ProgressParser, UnknownDurationKeepsFractionAtZero) {
    ProgressParser parser;
    parser.feed_progress("out_time_us=6000000");
    const auto ev = parser.feed_progress("progress=continue");
    ASSERT_TRUE(ev.has_value());
    EXPECT_DOUBLE_EQ(ev->fraction, 0.0);
    EXPECT_EQ(ev->out_time_us, 6'000'000u);
}

TEST(ProgressParser, IgnoresGarbageValues) {
    ProgressParser parser;
    parser.feed_diagnostic("Duration: 00:00:10.00, start: 0.0");
    parser.feed_progress("out_time_us=4000000");
    parser.feed_progress("out_time_us=N/A");
    parser.feed_progress("not a key value line");
    EXPECT_DOUBLE_EQ(parser.feed_progress("progress=continue")->fraction, 0.4);
}

TEST(ProgressParser, AcceptsOutTimeAsTimestamp) {
    ProgressParser parser;
    parser.feed_diagnostic("Duration: 00:00:10.00, start: 0.0");
    parser.feed_progress("out_time=00:00:05.000000");
    EXPECT_DOUBLE_EQ(parser.feed_progress("progress=continue")->fraction, 0.5);
}

TEST(ProgressParser, KeepsBoundedDiagnosticTail) {
    ProgressParser parser;
    for (size_t i = 0; i < ProgressParser::kDiagnosticTailLines + 5; ++i) {
        parser.feed_diagnostic("line " + std::to_string(i));
    }
    const std::string tail = parser.diagnostic_tail();
    EXPECT_EQ(tail.find("line 4\n"), std::string::npos);
    EXPECT_NE(tail.find("line 5\n"), std::string::npos);
    EXPECT_EQ(tail.substr(tail.rfind('\n') + 1), "line " + std::to_string(ProgressParser::kDiagnosticTailLines + 4));
}

TEST(ProgressStream, ReadsEventsFromAProcess) {
    TempDir dir;
    const auto stub = tinythis::test::write_stub_encoder(dir.path(), "enc", tinythis::test::kSucceedingEncoder);
    auto out = dir.path() / "out.mp4";

    Subprocess proc = Subprocess::spawn(stub, {out.string()});
    ProgressParser parser;
    ProgressStream stream(proc, parser);

    std::stop_source never;
    std::vector<ProgressEvent> events;
    while (const auto ev = stream.next(never.get_token())) {
        events.push_back(*ev);
    }
    EXPECT_TRUE(stream.exhausted());
    EXPECT_FALSE(stream.next(never.get_token()).has_value());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].frame, 10u);
    EXPECT_FALSE(events[0].ended);
    EXPECT_EQ(events[1].frame, 20u);
    EXPECT_TRUE(events[1].ended);
    EXPECT_LE(events[1].fraction, ProgressParser::kMaxRunningFraction);
    EXPECT_TRUE(proc.wait().success());
}

TEST(ProgressStream, StopsWhenRequested) {
    TempDir dir;
    const auto stub = tinythis::test::write_stub_encoder(dir.path(), "enc", tinythis::test::kSleepingEncoder);

    Subprocess proc = Subprocess::spawn(stub, {(dir.path() / "out.mp4").string()});
    ProgressParser parser;
    ProgressStream stream(proc, parser);

    std::stop_source stop;
    stop.request_stop();
    EXPECT_FALSE(stream.next(stop.get_token()).has_value());
    EXPECT_FALSE(stream.exhausted());
    EXPECT_FALSE(proc.terminate(std::chrono::milliseconds(500)).success());
}
