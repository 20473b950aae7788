#ifndef TINYTHIS_EVENTS_HPP
#define TINYTHIS_EVENTS_HPP

#include "encode_job.hpp"
#include "preset.hpp"

#include <cstddef>
#include <filesystem>

namespace tinythis {

/**
 * @brief Events published by the JobQueue.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (console printer, TUI activity log, tests) about job lifecycle changes.
 * They are always published from the thread that owns the queue.
 */

/**
 * @brief Aggregate job counts.
 */
struct QueueSummary {
    size_t pending = 0;
    size_t running = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t cancelled = 0;

    [[nodiscard]] size_t total() const noexcept { return pending + running + succeeded + failed + cancelled; }
    [[nodiscard]] size_t finished() const noexcept { return succeeded + failed + cancelled; }
    [[nodiscard]] bool drained() const noexcept { return pending == 0 && running == 0; }
};

/**
 * @brief Emitted when a file is accepted into the queue.
 */
struct JobQueuedEvent {
    JobId id = 0;
    std::filesystem::path input;    ///< Absolute input path
    Preset preset = kDefaultPreset;
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
};

/**
 * @brief Emitted when the encoder for a job has been handed to the worker.
 */
struct JobStartedEvent {
    JobId id = 0;
    std::filesystem::path input;
    std::filesystem::path output;   ///< Resolved destination
    Preset preset = kDefaultPreset;
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
    size_t position = 0;            ///< 1-based index among jobs of this run
    size_t total = 0;               ///< Jobs started plus still pending
};

/**
 * @brief Emitted when a running job's progress fraction increases.
 */
struct JobProgressEvent {
    JobId id = 0;
    double fraction = 0.0;          ///< [0, 0.99] while running
    std::uint64_t frame = 0;
    std::uint64_t out_time_us = 0;
};

/**
 * @brief Emitted when a job reaches a terminal state.
 */
struct JobFinishedEvent {
    JobId id = 0;
    std::filesystem::path input;
    JobResult result;
};

/**
 * @brief Emitted when a pending job is removed from the queue.
 */
struct JobRemovedEvent {
    JobId id = 0;
    std::filesystem::path input;
};

/**
 * @brief Emitted once nothing is pending or running after a job finished.
 */
struct QueueDrainedEvent {
    QueueSummary summary;
};

} // namespace tinythis

#endif // TINYTHIS_EVENTS_HPP
