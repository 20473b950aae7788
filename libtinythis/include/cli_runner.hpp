/**
 * @file cli_runner.hpp
 * @brief Non-interactive driver: build a queue from arguments, run it, report.
 */

#ifndef TINYTHIS_CLI_RUNNER_HPP
#define TINYTHIS_CLI_RUNNER_HPP

#include "event_bus.hpp"
#include "events.hpp"
#include "encoder_locator.hpp"
#include "job_queue.hpp"
#include "preset.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <vector>

namespace tinythis {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;       ///< A job failed or an input was rejected
inline constexpr int kExitUsage = 2;         ///< No valid input files
inline constexpr int kExitNoEncoder = 3;     ///< Encoder could not be located
inline constexpr int kExitInterrupted = 130; ///< Stopped by SIGINT

/**
 * @brief What to compress and how.
 */
struct RunRequest {
    Preset preset = kDefaultPreset;
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Outcome of a batch run.
 */
struct RunReport {
    size_t accepted = 0;
    size_t rejected = 0;
    QueueSummary summary;
    std::vector<JobSnapshot> jobs;
    bool interrupted = false;
    int exit_code = kExitSuccess;
};

/**
 * @brief Runs a list of files through a JobQueue to completion.
 *
 * @details Inputs go through the same JobQueue::enqueue validation as the
 * interactive session. Rejections are logged and counted, and the
 * remaining files still run. Jobs are started one at a time until none
 * is pending; a failed job never stops its siblings.
 *
 * Exit code: kExitSuccess only if every input was accepted and every job
 * succeeded; kExitUsage if no input was valid; kExitNoEncoder if no
 * encoder is available; kExitInterrupted after request_stop();
 * kExitFailure otherwise.
 */
class CliRunner {
public:
    CliRunner(const IEncoderLocator& locator, EventBus& bus, QueueOptions options = {})
        : locator_(locator), bus_(bus), options_(options) {}

    /**
     * @brief Runs the request to completion.
     * @throws ValidationError (EmptyFileList) if @p request has no inputs.
     */
    RunReport run(const RunRequest& request);

    /**
     * @brief Cancels the running job and stops the batch.
     *
     * Only sets an atomic flag, so it is safe to call from a signal handler
     * or another thread.
     */
    void request_stop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(std::memory_order_relaxed); }

private:
    static constexpr std::chrono::milliseconds kPollInterval{100};

    const IEncoderLocator& locator_;
    EventBus& bus_;
    QueueOptions options_;
    std::atomic<bool> stop_requested_{false};
};

} // namespace tinythis

#endif // TINYTHIS_CLI_RUNNER_HPP
