/**
 * @file encode_job.hpp
 * @brief One input file's transcode attempt and its lifecycle.
 */

#ifndef TINYTHIS_ENCODE_JOB_HPP
#define TINYTHIS_ENCODE_JOB_HPP

#include "input_file.hpp"
#include "mailbox.hpp"
#include "preset.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tinythis {

using JobId = std::uint64_t;

/**
 * @brief Lifecycle states. Pending is initial; the last three are terminal.
 */
enum class JobState {
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr bool is_terminal(const JobState s) noexcept {
    return s == JobState::Succeeded || s == JobState::Failed || s == JobState::Cancelled;
}

[[nodiscard]] std::string_view to_string(JobState state) noexcept;

/**
 * @brief Why a job ended in JobState::Failed.
 */
enum class FailureCause {
    None,
    ExitStatus,   ///< Encoder exited non-zero
    Signal,       ///< Encoder was killed by a signal it was not sent by us
    EmptyOutput,  ///< Exit 0 but the output is missing or empty
    Spawn,        ///< Encoder could not be executed
    Filesystem    ///< Output directory unusable or no free output name
};

[[nodiscard]] std::string_view to_string(FailureCause cause) noexcept;

/**
 * @brief Terminal outcome of a job.
 */
struct JobResult {
    JobState outcome = JobState::Pending;
    std::filesystem::path output_path;      ///< Final output on success, attempted path otherwise
    std::uintmax_t output_size = 0;
    FailureCause cause = FailureCause::None;
    std::string detail;                     ///< Human-readable reason plus encoder stderr tail
    std::optional<int> exit_code;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Everything the background worker needs, captured by value when the
 * job starts. The worker never touches the EncodeJob itself.
 */
struct EncodeTask {
    JobId id = 0;
    std::filesystem::path encoder;
    std::vector<std::string> arguments;
    std::filesystem::path output_path;
    std::stop_token cancel;
    std::chrono::milliseconds grace{3000};
};

// --- Worker -> owner messages ---

struct JobProgressMessage {
    JobId id = 0;
    double fraction = 0.0;
    std::uint64_t frame = 0;
    std::uint64_t out_time_us = 0;
};

struct JobFinishedMessage {
    JobId id = 0;
    JobResult result;
};

using JobMessage = std::variant<JobProgressMessage, JobFinishedMessage>;
using JobMailbox = Mailbox<JobMessage>;

/**
 * @brief A single transcode: pending -> running -> {succeeded, failed, cancelled}.
 *
 * @details The job object lives on the owner's thread (the JobQueue's
 * caller). Starting it resolves the output path against the current
 * filesystem and returns an EncodeTask; EncodeJob::execute runs that task
 * on a worker and reports back through a JobMailbox. The owner applies
 * those messages with apply(), so job state is only ever written by one
 * thread.
 *
 * Preset and accelerator mode are fixed when the job is created. A
 * terminal job is never modified again; retrying means creating a new job.
 */
class EncodeJob {
public:
    EncodeJob(JobId id, InputFile input, Preset preset, AcceleratorMode accelerator);

    EncodeJob(const EncodeJob&) = delete;
    EncodeJob& operator=(const EncodeJob&) = delete;

    [[nodiscard]] JobId id() const noexcept { return id_; }
    [[nodiscard]] const InputFile& input() const noexcept { return input_; }
    [[nodiscard]] Preset preset() const noexcept { return preset_; }
    [[nodiscard]] AcceleratorMode accelerator() const noexcept { return accelerator_; }
    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] double progress() const noexcept { return progress_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& output_path() const noexcept { return output_path_; }
    [[nodiscard]] const std::optional<JobResult>& result() const noexcept { return result_; }
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_.stop_requested(); }

    /**
     * @brief pending -> running.
     *
     * Resolves the output path and builds the encoder command line.
     * @param encoder Path to the encoder executable.
     * @param grace Bounded teardown time used on cancellation.
     * @throws InvalidOperation if the job is not pending.
     * @throws FilesystemError if no output name can be resolved; the job is
     *         then already marked failed.
     */
    [[nodiscard]] EncodeTask start(const std::filesystem::path& encoder,
                                   std::chrono::milliseconds grace = std::chrono::milliseconds(3000));

    /// Signals the worker to terminate the encoder. No-op unless running.
    void request_cancel() noexcept;

    /**
     * @brief Applies a worker message addressed to this job.
     * @return true if the job changed state or progress.
     */
    bool apply(const JobMessage& message);

    /**
     * @brief Worker side: runs the encoder described by @p task to completion.
     *
     * Posts JobProgressMessage while running and exactly one
     * JobFinishedMessage at the end. Any file at the output path is removed
     * unless the job succeeded.
     */
    static void execute(const EncodeTask& task, const std::stop_token& worker_stop, JobMailbox& mailbox);

private:
    void finish(JobResult result);

    JobId id_;
    InputFile input_;
    Preset preset_;
    AcceleratorMode accelerator_;
    JobState state_ = JobState::Pending;
    double progress_ = 0.0;
    std::optional<std::filesystem::path> output_path_;
    std::optional<JobResult> result_;
    std::stop_source cancel_;
};

} // namespace tinythis

#endif // TINYTHIS_ENCODE_JOB_HPP
