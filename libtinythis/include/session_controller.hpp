/**
 * @file session_controller.hpp
 * @brief Interactive state machine driving a JobQueue from user events.
 */

#ifndef TINYTHIS_SESSION_CONTROLLER_HPP
#define TINYTHIS_SESSION_CONTROLLER_HPP

#include "job_queue.hpp"
#include "preset.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tinythis {

enum class SessionMode {
    Browsing,    ///< Editing the file list; nothing runs
    Compressing  ///< Draining the queue
};

[[nodiscard]] constexpr std::string_view to_string(const SessionMode mode) noexcept {
    return mode == SessionMode::Compressing ? "compressing" : "browsing";
}

/**
 * @brief Input events understood by the session.
 *
 * Adding files carries a payload and goes through
 * SessionController::add_files instead.
 */
enum class SessionEvent {
    RemoveSelected,
    SelectPrev,
    SelectNext,
    PresetPrev,
    PresetNext,
    ToggleAccelerator,
    Run,
    Cancel,
    RetrySelected,
    ClearFinished,
    Back,
    Quit
};

/**
 * @brief Tally of one add-files request.
 */
struct AddFilesReport {
    size_t added = 0;
    size_t unsupported = 0;  ///< Extension not in the allow-list
    size_t invalid = 0;      ///< Missing, or not a regular file
    size_t duplicate = 0;    ///< Already pending in the queue

    /// "added 2 files, ignored 1 unsupported", or "no files".
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Everything a view needs to draw the session.
 */
struct SessionState {
    std::vector<JobSnapshot> jobs;
    std::optional<size_t> selection;   ///< Within [0, jobs.size() - 1]; unset when empty
    Preset preset = kDefaultPreset;    ///< Preset given to files added next
    AcceleratorMode accelerator = AcceleratorMode::Cpu;
    SessionMode mode = SessionMode::Browsing;
    std::string banner;                ///< Last status message
    std::optional<QueueSummary> last_summary;
    bool quit = false;
};

/**
 * @brief Owns the session state and applies events to it and the queue.
 *
 * @details Browsing is the initial mode. Run moves to Compressing and
 * starts the first pending job; tick() polls the queue and starts the
 * next pending job whenever the running one ends. Once nothing is pending
 * or running the session returns to Browsing with a summary of the run.
 * Cancel (or Back) while compressing cancels the running job and returns
 * to Browsing; pending jobs stay queued.
 *
 * Preset and accelerator changes apply to files added afterwards. Every
 * job keeps the preset and mode it was created with.
 *
 * Single-threaded: every call must come from the thread that owns the
 * queue.
 */
class SessionController {
public:
    using AcceleratorListener = std::function<void(AcceleratorMode)>;

    explicit SessionController(JobQueue& queue,
                                Preset preset = kDefaultPreset,
                                AcceleratorMode accelerator = AcceleratorMode::Cpu);

    /**
     * @brief Enqueues every acceptable path with the active preset and mode.
     *
     * Rejected paths are counted, never thrown. Paths already pending are
     * skipped as duplicates.
     */
    AddFilesReport add_files(const std::vector<std::filesystem::path>& paths);

    /**
     * @brief Applies one input event.
     * @return true if the state changed and should be re-rendered.
     */
    bool handle(SessionEvent event);

    /**
     * @brief Polls the queue and advances the run.
     * @param wait Upper bound to block for worker messages while compressing.
     * @return true if the state changed.
     */
    bool tick(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    [[nodiscard]] const SessionState& state() const noexcept { return state_; }

    /// Called after every accelerator toggle, e.g. to persist the choice.
    void set_accelerator_listener(AcceleratorListener listener) { accelerator_listener_ = std::move(listener); }

private:
    void start_run();
    void advance_run();
    void finish_run();
    void cancel_run(bool quitting);
    bool clear_finished();
    void refresh();
    void clamp_selection();
    [[nodiscard]] QueueSummary run_summary() const;

    JobQueue& queue_;
    SessionState state_;
    std::unordered_set<JobId> run_ids_;  ///< Jobs started since Run
    AcceleratorListener accelerator_listener_;
};

} // namespace tinythis

#endif // TINYTHIS_SESSION_CONTROLLER_HPP
