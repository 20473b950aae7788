/**
 * @file progress_parser.hpp
 * @brief Turns the encoder's progress and diagnostic output into progress events.
 */

#ifndef TINYTHIS_PROGRESS_PARSER_HPP
#define TINYTHIS_PROGRESS_PARSER_HPP

#include "subprocess.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace tinythis {

/**
 * @brief One completed `-progress` block.
 */
struct ProgressEvent {
    std::uint64_t frame = 0;        ///< Frames written so far
    std::uint64_t out_time_us = 0;  ///< Output timestamp in microseconds
    double fraction = 0.0;          ///< Non-decreasing, within [0, kMaxRunningFraction]
    bool ended = false;             ///< Encoder printed `progress=end`
};

/**
 * @brief Stateful parser for ffmpeg output.
 *
 * @details The total duration comes from the `Duration: HH:MM:SS.ff` line
 * ffmpeg prints on stderr while probing the input. Progress blocks arrive
 * on stdout as `key=value` lines and are terminated by `progress=continue`
 * or `progress=end`; each terminator yields one ProgressEvent.
 *
 * The reported fraction never decreases and never exceeds
 * kMaxRunningFraction; reaching 1.0 is decided by the job once the
 * encoder has exited successfully.
 */
class ProgressParser {
public:
    static constexpr double kMaxRunningFraction = 0.99;
    static constexpr size_t kDiagnosticTailLines = 30;

    /// Feeds one stdout line. Returns an event at the end of each block.
    std::optional<ProgressEvent> feed_progress(std::string_view line);

    /// Feeds one stderr line. Picks up the duration and keeps a bounded tail.
    void feed_diagnostic(std::string_view line);

    [[nodiscard]] std::optional<std::uint64_t> total_us() const noexcept { return total_us_; }
    [[nodiscard]] double fraction() const noexcept { return fraction_; }

    /// Last kDiagnosticTailLines stderr lines joined with '\n'.
    [[nodiscard]] std::string diagnostic_tail() const;

    /// Parses "Duration: 00:00:08.05, start: ..." into microseconds.
    [[nodiscard]] static std::optional<std::uint64_t> parse_duration_line(std::string_view line);

    /// Parses "HH:MM:SS[.ffffff]" into microseconds.
    [[nodiscard]] static std::optional<std::uint64_t> parse_timestamp_us(std::string_view text);

private:
    void update_fraction();

    std::optional<std::uint64_t> total_us_;
    ProgressEvent current_;
    double fraction_ = 0.0;
    std::deque<std::string> tail_;
};

/**
 * @brief Lazy, finite sequence of progress events read from a running encoder.
 *
 * @details Each call to next() reads from the process until a progress
 * block completes, the process output ends, or stop is requested. The
 * stream ends for good once the child closes its pipes or exits; it
 * cannot be restarted.
 */
class ProgressStream {
public:
    ProgressStream(Subprocess& process, ProgressParser& parser) noexcept
        : process_(process), parser_(parser) {}

    /// The next event, or std::nullopt at the end of the stream or on stop.
    std::optional<ProgressEvent> next(const std::stop_token& stop);

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

private:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    Subprocess& process_;
    ProgressParser& parser_;
    std::deque<ProgressEvent> ready_;
    bool exhausted_ = false;
};

} // namespace tinythis

#endif // TINYTHIS_PROGRESS_PARSER_HPP
