#include "../../include/encode_job.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/output_path_resolver.hpp"
#include "../../include/preset_table.hpp"
#include "../../include/progress_parser.hpp"
#include "../../include/subprocess.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace tinythis {

std::string_view to_string(const JobState state) noexcept {
    switch (state) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Succeeded: return "succeeded";
        case JobState::Failed:    return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "";
}

std::string_view to_string(const FailureCause cause) noexcept {
    switch (cause) {
        case FailureCause::None:        return "none";
        case FailureCause::ExitStatus:  return "exit status";
        case FailureCause::Signal:      return "signal";
        case FailureCause::EmptyOutput: return "empty output";
        case FailureCause::Spawn:       return "spawn";
        case FailureCause::Filesystem:  return "filesystem";
    }
    return "";
}

EncodeJob::EncodeJob(const JobId id, InputFile input, const Preset preset, const AcceleratorMode accelerator)
    : id_(id),
      input_(std::move(input)),
      preset_(preset),
      accelerator_(accelerator) {}

EncodeTask EncodeJob::start(const fs::path& encoder, const std::chrono::milliseconds grace) {
    if (state_ != JobState::Pending) {
        throw InvalidOperation("job " + std::to_string(id_) + " is " + std::string(to_string(state_)) + ", not pending");
    }
    state_ = JobState::Running;
    progress_ = 0.0;

    fs::path output;
    try {
        output = OutputPathResolver::resolve(input_.path, preset_);
    } catch (const FilesystemError& e) {
        JobResult r;
        r.outcome = JobState::Failed;
        r.cause = FailureCause::Filesystem;
        r.detail = e.what();
        finish(std::move(r));
        throw;
    }
    output_path_ = output;

    const EncodeProfile profile = PresetTable::arguments_for(preset_, accelerator_);

    EncodeTask task;
    task.id = id_;
    task.encoder = encoder;
    task.arguments = PresetTable::build_command(profile, input_.path, output);
    task.output_path = std::move(output);
    task.cancel = cancel_.get_token();
    task.grace = grace;

    std::string cmdline = encoder.string();
    for (const auto& a : task.arguments) {
        cmdline += ' ';
        cmdline += a;
    }
    Logger::log(LogLevel::Debug, "job " + std::to_string(id_) + ": " + cmdline, "job");
    return task;
}

void EncodeJob::request_cancel() noexcept {
    if (state_ == JobState::Running) {
        cancel_.request_stop();
    }
}

bool EncodeJob::apply(const JobMessage& message) {
    return std::visit([this](const auto& msg) -> bool {
        using T = std::decay_t<decltype(msg)>;
        if (msg.id != id_ || state_ != JobState::Running) {
            return false;
        }
        if constexpr (std::is_same_v<T, JobProgressMessage>) {
            const double f = std::min(msg.fraction, ProgressParser::kMaxRunningFraction);
            if (f <= progress_) {
                return false;
            }
            progress_ = f;
            return true;
        } else {
            finish(msg.result);
            return true;
        }
    }, message);
}

void EncodeJob::finish(JobResult result) {
    state_ = result.outcome;
    if (state_ == JobState::Succeeded) {
        progress_ = 1.0;
    }
    if (result.output_path.empty() && output_path_) {
        result.output_path = *output_path_;
    }
    result_ = std::move(result);
}

void EncodeJob::execute(const EncodeTask& task, const std::stop_token& worker_stop, JobMailbox& mailbox) {
    const auto started = std::chrono::steady_clock::now();
    const std::string tag = "job";
    const std::string name = "job " + std::to_string(task.id);

    // either a user cancel or pool shutdown stops the encode
    std::stop_source stop;
    std::stop_callback on_worker_stop(worker_stop, [&stop] { stop.request_stop(); });
    std::stop_callback on_cancel(task.cancel, [&stop] { stop.request_stop(); });
    const std::stop_token st = stop.get_token();

    const auto post = [&](JobResult r) {
        r.output_path = task.output_path;
        r.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        if (r.outcome != JobState::Succeeded) {
            remove_output(task.output_path, tag);
        }
        mailbox.push(JobFinishedMessage{task.id, std::move(r)});
    };

    const auto cancelled = [&] {
        Logger::log(LogLevel::Info, name + " cancelled", tag);
        JobResult r;
        r.outcome = JobState::Cancelled;
        r.detail = "cancelled";
        post(std::move(r));
    };

    if (st.stop_requested()) {
        cancelled();
        return;
    }

    const fs::path out_dir = task.output_path.has_parent_path() ? task.output_path.parent_path() : fs::path(".");
    if (!is_directory_writable(out_dir)) {
        Logger::log(LogLevel::Error, name + ": output directory not writable: " + out_dir.string(), tag);
        JobResult r;
        r.outcome = JobState::Failed;
        r.cause = FailureCause::Filesystem;
        r.detail = "output directory not writable: " + out_dir.string();
        post(std::move(r));
        return;
    }

    Subprocess proc;
    try {
        proc = Subprocess::spawn(task.encoder, task.arguments);
    } catch (const std::system_error& e) {
        Logger::log(LogLevel::Error, name + ": cannot start encoder: " + std::string(e.what()), tag);
        JobResult r;
        r.outcome = JobState::Failed;
        r.cause = FailureCause::Spawn;
        r.detail = std::string("cannot start encoder: ") + e.what();
        post(std::move(r));
        return;
    }

    ProgressParser parser;
    ProgressStream stream(proc, parser);
    double last_fraction = 0.0;
    while (const auto ev = stream.next(st)) {
        if (ev->fraction > last_fraction) {
            last_fraction = ev->fraction;
            mailbox.push(JobProgressMessage{task.id, ev->fraction, ev->frame, ev->out_time_us});
        }
    }

    if (st.stop_requested()) {
        const ExitStatus status = proc.terminate(task.grace);
        Logger::log(LogLevel::Debug, name + ": encoder stopped (" + status.describe() + ")", tag);
        cancelled();
        return;
    }

    const ExitStatus status = proc.wait();
    const std::string tail = parser.diagnostic_tail();

    if (!status.success()) {
        JobResult r;
        r.outcome = JobState::Failed;
        r.cause = status.exited ? FailureCause::ExitStatus : FailureCause::Signal;
        if (status.exited) {
            r.exit_code = status.code;
        }
        r.detail = "encoder failed (" + status.describe() + ")";
        if (!tail.empty()) {
            r.detail += "\n" + tail;
        }
        Logger::log(LogLevel::Error, name + ": " + r.detail, tag);
        post(std::move(r));
        return;
    }

    const auto size = safe_file_size(task.output_path);
    if (size == 0) {
        JobResult r;
        r.outcome = JobState::Failed;
        r.cause = FailureCause::EmptyOutput;
        r.exit_code = status.code;
        r.detail = "encoder exited successfully but produced no output: " + task.output_path.string();
        Logger::log(LogLevel::Error, name + ": " + r.detail, tag);
        post(std::move(r));
        return;
    }

    JobResult r;
    r.outcome = JobState::Succeeded;
    r.exit_code = status.code;
    r.output_size = size;
    Logger::log(LogLevel::Info, name + " done: " + task.output_path.string() + " (" + std::to_string(size) + " bytes)", tag);
    post(std::move(r));
}

} // namespace tinythis
