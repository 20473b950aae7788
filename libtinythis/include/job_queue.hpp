/**
 * @file job_queue.hpp
 * @brief Ordered, serialized collection of encode jobs.
 */

#ifndef TINYTHIS_JOB_QUEUE_HPP
#define TINYTHIS_JOB_QUEUE_HPP

#include "encode_job.hpp"
#include "encoder_locator.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "thread_pool.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace tinythis {

/**
 * @brief Tunables for a JobQueue.
 */
struct QueueOptions {
    /// Time the encoder gets between SIGTERM and SIGKILL on cancellation.
    std::chrono::milliseconds cancel_grace{3000};
};

/**
 * @brief Value copy of a job, for rendering and reporting.
 */
struct JobSnapshot {
    JobId id = 0;
    std::filesystem::path input;
    std::uintmax_t input_size = 0;              ///< Measured when the file was queued
    Preset preset = kDefaultPreset;
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
    JobState state = JobState::Pending;
    double progress = 0.0;
    std::optional<std::filesystem::path> output_path;
    std::optional<JobResult> result;
};

/**
 * @brief FIFO queue of EncodeJobs with at most one job running.
 *
 * @details Insertion order is processing order. run_next() hands the
 * lowest-index pending job to a single background worker; the worker
 * never touches the queue and reports through a mailbox that poll()
 * drains on the caller's thread. All job mutations and all EventBus
 * publications therefore happen on the thread that owns the queue.
 *
 * Job-level failures are recorded on the job and never thrown. The
 * operations below only throw when they are rejected up front.
 *
 * Destroying the queue while a job is running cancels it and waits for
 * the worker, so no encoder or partial output outlives the queue.
 */
class JobQueue {
public:
    JobQueue(const IEncoderLocator& locator, EventBus& bus, QueueOptions options = {});
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    /**
     * @brief Validates @p path and appends a pending job.
     * @throws ValidationError if the file is rejected; the queue is unchanged.
     */
    JobId enqueue(const std::filesystem::path& path, Preset preset, AcceleratorMode accelerator);

    /**
     * @brief Removes the pending job at @p index. Order of the rest is kept.
     * @throws std::out_of_range for a bad index.
     * @throws InvalidOperation if the job is not pending.
     */
    void remove(size_t index);

    /**
     * @brief Starts the lowest-index pending job.
     *
     * No-op returning false if a job is already running or nothing is
     * pending. A job whose output name cannot be resolved fails right away
     * and still counts as started.
     * @throws ResourceUnavailable if no encoder can be located. The job
     *         stays pending and nothing is spawned.
     */
    bool run_next();

    /**
     * @brief Cancels the running job and waits until the worker reports it.
     *
     * The wait is bounded by the cancel grace period plus a small margin.
     * Pending jobs are left alone.
     * @return false if no job was running.
     */
    bool cancel_running();

    /**
     * @brief Applies worker messages and publishes the resulting events.
     * @param wait Upper bound to block for the first message while a job runs.
     * @return Number of messages applied.
     */
    size_t poll(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /**
     * @brief Re-enqueues a failed or cancelled job as a new pending job.
     * @throws std::out_of_range, InvalidOperation, ValidationError.
     */
    JobId retry(size_t index);

    /// Drops every terminal job. Returns how many were dropped.
    size_t clear_finished();

    [[nodiscard]] size_t size() const noexcept { return jobs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return jobs_.empty(); }

    /// @throws std::out_of_range
    [[nodiscard]] const EncodeJob& at(size_t index) const;

    [[nodiscard]] const EncodeJob* find(JobId id) const;
    [[nodiscard]] std::optional<size_t> running_index() const;
    [[nodiscard]] bool has_running() const { return running_index().has_value(); }
    [[nodiscard]] bool has_pending() const;

    /// True if a pending job already targets @p input (compared as absolute paths).
    [[nodiscard]] bool has_pending_input(const std::filesystem::path& input) const;

    [[nodiscard]] QueueSummary summary() const;
    [[nodiscard]] std::vector<JobSnapshot> snapshot() const;

    [[nodiscard]] const QueueOptions& options() const noexcept { return options_; }

private:
    EncodeJob* find_mutable(JobId id);
    void apply(const JobMessage& message);
    void finish_worker();

    const IEncoderLocator& locator_;
    EventBus& bus_;
    QueueOptions options_;
    JobId next_id_ = 1;
    size_t run_started_ = 0;                      ///< Jobs started since the queue was last drained
    std::vector<std::unique_ptr<EncodeJob>> jobs_;
    JobMailbox mailbox_;                          ///< Worker -> owner messages
    std::future<void> worker_;                    ///< Completion of the task currently on the pool
    ThreadPool pool_{1, "encoder"};               ///< Declared last: joined before the mailbox goes away
};

} // namespace tinythis

#endif // TINYTHIS_JOB_QUEUE_HPP
