#include "../../include/job_queue.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace tinythis {

namespace {

    constexpr std::chrono::milliseconds kCancelMargin{2000};
    constexpr std::chrono::milliseconds kCancelPollStep{50};

    fs::path absolute_normal(const fs::path& p) {
        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        return (ec ? p : abs).lexically_normal();
    }

} // namespace

JobQueue::JobQueue(const IEncoderLocator& locator, EventBus& bus, QueueOptions options)
    : locator_(locator),
      bus_(bus),
      options_(options) {}

JobQueue::~JobQueue() {
    for (const auto& job : jobs_) {
        if (job->state() == JobState::Running) {
            Logger::log(LogLevel::Info, "queue destroyed, cancelling job " + std::to_string(job->id()), "queue");
            job->request_cancel();
        }
    }
    // the worker observes the stop, tears the encoder down and is joined by pool_
    pool_.request_stop();
    if (!pool_.wait_idle_for(options_.cancel_grace + kCancelMargin)) {
        Logger::log(LogLevel::Warning, "encoder worker still busy at shutdown, waiting for it", "queue");
    }
}

JobId JobQueue::enqueue(const fs::path& path, const Preset preset, const AcceleratorMode accelerator) {
    InputFile input = InputFile::validate(path);

    const JobId id = next_id_++;
    const fs::path input_path = input.path;
    jobs_.push_back(std::make_unique<EncodeJob>(id, std::move(input), preset, accelerator));

    Logger::log(LogLevel::Debug,
                "queued job " + std::to_string(id) + ": " + input_path.string() +
                " [" + std::string(to_string(preset)) + ", " + std::string(to_string(accelerator)) + "]",
                "queue");
    bus_.publish(JobQueuedEvent{id, input_path, preset, accelerator});
    return id;
}

void JobQueue::remove(const size_t index) {
    if (index >= jobs_.size()) {
        throw std::out_of_range("job index " + std::to_string(index) + " out of range");
    }
    const EncodeJob& job = *jobs_[index];
    if (job.state() != JobState::Pending) {
        throw InvalidOperation("only pending jobs can be removed (job is " + std::string(to_string(job.state())) + ")");
    }
    const JobRemovedEvent ev{job.id(), job.input().path};
    jobs_.erase(jobs_.begin() + static_cast<std::ptrdiff_t>(index));

    Logger::log(LogLevel::Debug, "removed job " + std::to_string(ev.id), "queue");
    bus_.publish(ev);
}

bool JobQueue::run_next() {
    if (has_running()) {
        return false;
    }
    const auto it = std::find_if(jobs_.begin(), jobs_.end(), [](const auto& j) {
        return j->state() == JobState::Pending;
    });
    if (it == jobs_.end()) {
        return false;
    }

    const auto encoder = locator_.locate();
    if (!encoder) {
        Logger::log(LogLevel::Error, "no encoder available", "queue");
        throw ResourceUnavailable("no encoder available: install ffmpeg or pass --ffmpeg <path>");
    }

    EncodeJob& job = **it;
    ++run_started_;

    EncodeTask task;
    try {
        task = job.start(*encoder, options_.cancel_grace);
    } catch (const FilesystemError& e) {
        Logger::log(LogLevel::Error, "job " + std::to_string(job.id()) + ": " + e.what(), "queue");
        bus_.publish(JobFinishedEvent{job.id(), job.input().path, *job.result()});
        if (const auto s = summary(); s.drained()) {
            run_started_ = 0;
            bus_.publish(QueueDrainedEvent{s});
        }
        return true;
    }

    const size_t remaining = static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto& j) {
        return j->state() == JobState::Pending;
    }));

    Logger::log(LogLevel::Info,
                "starting job " + std::to_string(job.id()) + ": " + job.input().path.string() +
                " -> " + task.output_path.string(),
                "queue");
    bus_.publish(JobStartedEvent{job.id(), job.input().path, task.output_path, job.preset(),
                                 job.accelerator(), run_started_, run_started_ + remaining});

    worker_ = pool_.enqueue([this, task = std::move(task)](const std::stop_token& st) {
        EncodeJob::execute(task, st, mailbox_);
    });
    return true;
}

bool JobQueue::cancel_running() {
    const auto idx = running_index();
    if (!idx) {
        return false;
    }
    EncodeJob& job = *jobs_[*idx];
    const JobId id = job.id();
    Logger::log(LogLevel::Info, "cancelling job " + std::to_string(id), "queue");
    job.request_cancel();

    const auto deadline = std::chrono::steady_clock::now() + options_.cancel_grace + kCancelMargin;
    while (std::chrono::steady_clock::now() < deadline) {
        poll(kCancelPollStep);
        const EncodeJob* current = find(id);
        if (current == nullptr || is_terminal(current->state())) {
            return true;
        }
    }
    Logger::log(LogLevel::Warning, "job " + std::to_string(id) + " did not report cancellation in time", "queue");
    return true;
}

size_t JobQueue::poll(const std::chrono::milliseconds wait) {
    // once the task has returned, everything it posted is already in the mailbox
    const bool worker_done = worker_.valid() &&
                             worker_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    const bool was_running = has_running();

    std::optional<JobMessage> msg;
    if (wait.count() > 0 && was_running && !worker_done) {
        msg = mailbox_.wait_pop(wait);
    } else {
        msg = mailbox_.try_pop();
    }

    size_t applied = 0;
    while (msg) {
        apply(*msg);
        ++applied;
        msg = mailbox_.try_pop();
    }

    if (worker_done) {
        finish_worker();
    }

    if (was_running && !has_running()) {
        if (const auto s = summary(); s.drained()) {
            Logger::log(LogLevel::Info,
                        "queue drained: " + std::to_string(s.succeeded) + " succeeded, " +
                        std::to_string(s.failed) + " failed, " + std::to_string(s.cancelled) + " cancelled",
                        "queue");
            run_started_ = 0;
            bus_.publish(QueueDrainedEvent{s});
        }
    }
    return applied;
}

void JobQueue::apply(const JobMessage& message) {
    const JobId id = std::visit([](const auto& m) { return m.id; }, message);
    EncodeJob* job = find_mutable(id);
    if (job == nullptr || !job->apply(message)) {
        return;
    }

    if (const auto* progress = std::get_if<JobProgressMessage>(&message)) {
        bus_.publish(JobProgressEvent{id, job->progress(), progress->frame, progress->out_time_us});
        return;
    }

    const JobResult& result = *job->result();
    Logger::log(result.outcome == JobState::Succeeded ? LogLevel::Info : LogLevel::Warning,
                "job " + std::to_string(id) + " " + std::string(to_string(result.outcome)), "queue");
    bus_.publish(JobFinishedEvent{id, job->input().path, result});
}

void JobQueue::finish_worker() {
    std::string error;
    try {
        worker_.get();
    } catch (const std::exception& e) {
        error = e.what();
    }
    worker_ = {};

    // a worker that returned without a finished message leaves its job running
    const auto idx = running_index();
    if (!idx) {
        return;
    }
    JobResult r;
    r.outcome = JobState::Failed;
    r.cause = FailureCause::Spawn;
    r.detail = "encoder worker stopped without a result";
    if (!error.empty()) {
        r.detail += ": " + error;
    }
    if (const auto& out = jobs_[*idx]->output_path()) {
        r.output_path = *out;
    }
    Logger::log(LogLevel::Error, "job " + std::to_string(jobs_[*idx]->id()) + ": " + r.detail, "queue");
    apply(JobFinishedMessage{jobs_[*idx]->id(), std::move(r)});
}

JobId JobQueue::retry(const size_t index) {
    const EncodeJob& job = at(index);
    if (job.state() != JobState::Failed && job.state() != JobState::Cancelled) {
        throw InvalidOperation("only failed or cancelled jobs can be retried (job is " +
                               std::string(to_string(job.state())) + ")");
    }
    const fs::path input = job.input().path;
    Logger::log(LogLevel::Info, "retrying job " + std::to_string(job.id()), "queue");
    return enqueue(input, job.preset(), job.accelerator());
}

size_t JobQueue::clear_finished() {
    const auto before = jobs_.size();
    std::erase_if(jobs_, [](const auto& j) { return is_terminal(j->state()); });
    return before - jobs_.size();
}

const EncodeJob& JobQueue::at(const size_t index) const {
    if (index >= jobs_.size()) {
        throw std::out_of_range("job index " + std::to_string(index) + " out of range");
    }
    return *jobs_[index];
}

const EncodeJob* JobQueue::find(const JobId id) const {
    const auto it = std::find_if(jobs_.begin(), jobs_.end(), [id](const auto& j) { return j->id() == id; });
    return it == jobs_.end() ? nullptr : it->get();
}

EncodeJob* JobQueue::find_mutable(const JobId id) {
    const auto it = std::find_if(jobs_.begin(), jobs_.end(), [id](const auto& j) { return j->id() == id; });
    return it == jobs_.end() ? nullptr : it->get();
}

std::optional<size_t> JobQueue::running_index() const {
    for (size_t i = 0; i < jobs_.size(); ++i) {
        if (jobs_[i]->state() == JobState::Running) return i;
    }
    return std::nullopt;
}

bool JobQueue::has_pending() const {
    return std::any_of(jobs_.begin(), jobs_.end(), [](const auto& j) {
        return j->state() == JobState::Pending;
    });
}

bool JobQueue::has_pending_input(const fs::path& input) const {
    const fs::path key = absolute_normal(input);
    return std::any_of(jobs_.begin(), jobs_.end(), [&key](const auto& j) {
        return j->state() == JobState::Pending && j->input().path == key;
    });
}

QueueSummary JobQueue::summary() const {
    QueueSummary s;
    for (const auto& j : jobs_) {
        switch (j->state()) {
            case JobState::Pending:   ++s.pending; break;
            case JobState::Running:   ++s.running; break;
            case JobState::Succeeded: ++s.succeeded; break;
            case JobState::Failed:    ++s.failed; break;
            case JobState::Cancelled: ++s.cancelled; break;
        }
    }
    return s;
}

std::vector<JobSnapshot> JobQueue::snapshot() const {
    std::vector<JobSnapshot> out;
    out.reserve(jobs_.size());
    for (const auto& j : jobs_) {
        out.push_back(JobSnapshot{j->id(), j->input().path, j->input().size_bytes, j->preset(), j->accelerator(),
                                  j->state(), j->progress(), j->output_path(), j->result()});
    }
    return out;
}

} // namespace tinythis
