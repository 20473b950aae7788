#include "../../include/session_controller.hpp"
#include "../../include/errors.hpp"
#include "../../include/input_file.hpp"
#include "../../include/logger.hpp"

#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace tinythis {

namespace {

    std::string plural(const size_t n, const std::string_view word) {
        std::string s = std::to_string(n) + " " + std::string(word);
        if (n != 1) s += 's';
        return s;
    }

} // namespace

std::string AddFilesReport::describe() const {
    if (added == 0 && unsupported == 0 && invalid == 0 && duplicate == 0) {
        return "no files";
    }
    std::string out;
    const auto part = [&out](const std::string& p) {
        if (!out.empty()) out += ", ";
        out += p;
    };
    if (added > 0) part("added " + plural(added, "file"));
    if (unsupported > 0) part("ignored " + std::to_string(unsupported) + " unsupported");
    if (invalid > 0) part("ignored " + std::to_string(invalid) + " invalid");
    if (duplicate > 0) part("ignored " + std::to_string(duplicate) + " duplicate");
    return out;
}

SessionController::SessionController(JobQueue& queue, const Preset preset, const AcceleratorMode accelerator)
    : queue_(queue) {
    state_.preset = preset;
    state_.accelerator = accelerator;
    refresh();
}

AddFilesReport SessionController::add_files(const std::vector<fs::path>& paths) {
    AddFilesReport report;
    for (const auto& p : paths) {
        if (queue_.has_pending_input(p)) {
            ++report.duplicate;
            continue;
        }
        try {
            queue_.enqueue(p, state_.preset, state_.accelerator);
            ++report.added;
        } catch (const ValidationError& e) {
            Logger::log(LogLevel::Debug, e.what(), "session");
            if (e.reason() == ValidationError::Reason::UnsupportedExtension) {
                ++report.unsupported;
            } else {
                ++report.invalid;
            }
        }
    }
    state_.banner = report.describe();
    refresh();
    return report;
}

bool SessionController::handle(const SessionEvent event) {
    switch (event) {
        case SessionEvent::SelectPrev:
            if (state_.jobs.empty()) return false;
            if (!state_.selection) {
                state_.selection = state_.jobs.size() - 1;
            } else if (*state_.selection > 0) {
                --*state_.selection;
            } else {
                return false;
            }
            return true;

        case SessionEvent::SelectNext:
            if (state_.jobs.empty()) return false;
            if (!state_.selection) {
                state_.selection = 0;
            } else if (*state_.selection + 1 < state_.jobs.size()) {
                ++*state_.selection;
            } else {
                return false;
            }
            return true;

        case SessionEvent::PresetPrev:
        case SessionEvent::PresetNext:
            state_.preset = event == SessionEvent::PresetNext ? next_preset(state_.preset)
                                                              : prev_preset(state_.preset);
            state_.banner = "preset: " + std::string(to_string(state_.preset));
            return true;

        case SessionEvent::ToggleAccelerator:
            state_.accelerator = toggled(state_.accelerator);
            state_.banner = "accelerator: " + std::string(to_string(state_.accelerator));
            if (accelerator_listener_) {
                accelerator_listener_(state_.accelerator);
            }
            return true;

        case SessionEvent::RemoveSelected:
            if (!state_.selection) return false;
            try {
                queue_.remove(*state_.selection);
                state_.banner.clear();
            } catch (const InvalidOperation& e) {
                state_.banner = e.what();
            }
            refresh();
            return true;

        case SessionEvent::RetrySelected:
            if (!state_.selection) return false;
            try {
                queue_.retry(*state_.selection);
                state_.banner = "queued again";
            } catch (const InvalidOperation& e) {
                state_.banner = e.what();
            } catch (const ValidationError& e) {
                state_.banner = e.what();
            }
            refresh();
            return true;

        case SessionEvent::Run:
            if (state_.mode == SessionMode::Compressing) return false;
            start_run();
            refresh();
            return true;

        case SessionEvent::ClearFinished:
            return clear_finished();

        case SessionEvent::Cancel:
        case SessionEvent::Back:
            if (state_.mode == SessionMode::Compressing) {
                cancel_run(false);
                refresh();
                return true;
            }
            // first press dismisses the banner, the next one clears finished rows
            if (state_.banner.empty()) {
                return event == SessionEvent::Back && clear_finished();
            }
            state_.banner.clear();
            return true;

        case SessionEvent::Quit:
            if (state_.mode == SessionMode::Compressing) {
                cancel_run(true);
                refresh();
            }
            state_.quit = true;
            return true;
    }
    return false;
}

bool SessionController::tick(const std::chrono::milliseconds wait) {
    const bool compressing = state_.mode == SessionMode::Compressing;
    bool changed = queue_.poll(compressing ? wait : std::chrono::milliseconds(0)) > 0;
    if (compressing && !queue_.has_running()) {
        advance_run();
        changed = true;
    }
    if (changed) {
        refresh();
    }
    return changed;
}

void SessionController::start_run() {
    if (!queue_.has_pending()) {
        state_.banner = "nothing to compress";
        return;
    }
    run_ids_.clear();
    state_.last_summary.reset();
    state_.mode = SessionMode::Compressing;
    advance_run();
}

void SessionController::advance_run() {
    try {
        while (!queue_.has_running() && queue_.has_pending()) {
            std::optional<JobId> next;
            for (size_t i = 0; i < queue_.size(); ++i) {
                if (queue_.at(i).state() == JobState::Pending) {
                    next = queue_.at(i).id();
                    break;
                }
            }
            if (!next || !queue_.run_next()) {
                break;
            }
            run_ids_.insert(*next);
            if (const EncodeJob* job = queue_.find(*next); job != nullptr && job->state() == JobState::Running) {
                state_.banner = "compressing " + job->input().path.filename().string() +
                                " [" + std::string(to_string(job->preset())) + "]";
            }
        }
    } catch (const ResourceUnavailable& e) {
        Logger::log(LogLevel::Error, e.what(), "session");
        state_.mode = SessionMode::Browsing;
        state_.banner = e.what();
        return;
    }
    if (!queue_.has_running()) {
        finish_run();
    }
}

void SessionController::finish_run() {
    const QueueSummary s = run_summary();
    state_.last_summary = s;
    state_.mode = SessionMode::Browsing;
    state_.banner = "done: " + std::to_string(s.succeeded) + " succeeded, " +
                    std::to_string(s.failed) + " failed, " +
                    std::to_string(s.cancelled) + " cancelled";
    Logger::log(LogLevel::Info, state_.banner, "session");
}

void SessionController::cancel_run(const bool quitting) {
    queue_.cancel_running();
    state_.mode = SessionMode::Browsing;
    state_.last_summary = run_summary();
    const size_t pending = queue_.summary().pending;
    state_.banner = quitting ? "cancelled" : "cancelled, " + plural(pending, "file") + " still queued";
}

QueueSummary SessionController::run_summary() const {
    QueueSummary s;
    for (const JobId id : run_ids_) {
        const EncodeJob* job = queue_.find(id);
        if (job == nullptr) continue;
        switch (job->state()) {
            case JobState::Pending:   ++s.pending; break;
            case JobState::Running:   ++s.running; break;
            case JobState::Succeeded: ++s.succeeded; break;
            case JobState::Failed:    ++s.failed; break;
            case JobState::Cancelled: ++s.cancelled; break;
        }
    }
    return s;
}

bool SessionController::clear_finished() {
    if (state_.mode == SessionMode::Compressing) return false;
    const size_t removed = queue_.clear_finished();
    if (removed == 0) return false;
    state_.banner = "cleared " + std::to_string(removed) + (removed == 1 ? " finished file" : " finished files");
    refresh();
    return true;
}

void SessionController::refresh() {
    state_.jobs = queue_.snapshot();
    clamp_selection();
}

void SessionController::clamp_selection() {
    if (state_.jobs.empty()) {
        state_.selection.reset();
    } else if (!state_.selection) {
        state_.selection = 0;
    } else if (*state_.selection >= state_.jobs.size()) {
        state_.selection = state_.jobs.size() - 1;
    }
}

} // namespace tinythis
