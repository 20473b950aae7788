#include "progress_printer.hpp"
#include "../utils/color.hpp"
#include "../../../libtinythis/include/events.hpp"
#include "../../../libtinythis/include/file_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

using namespace tinythis;

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

namespace {

    std::string first_line(const std::string& s) {
        return s.substr(0, s.find('\n'));
    }

} // namespace

ProgressPrinter::ProgressPrinter(EventBus& bus, const bool use_colors)
    : bus_(bus),
      use_colors_(use_colors) {
    subscriptions_.push_back(bus.subscribe<JobStartedEvent>([this](const JobStartedEvent& e) {
        job_start_ = std::chrono::steady_clock::now();
        std::cerr << "compressing (" << e.position << "/" << e.total << ") ["
                  << to_string(e.preset) << (e.accelerator == AcceleratorMode::Gpu ? ", gpu" : "") << "] "
                  << e.input.string() << " -> " << e.output.string() << std::endl;
        print_bar(0.0);
    }));

    subscriptions_.push_back(bus.subscribe<JobProgressEvent>([this](const JobProgressEvent& e) {
        print_bar(e.fraction);
    }));

    subscriptions_.push_back(bus.subscribe<JobFinishedEvent>([this](const JobFinishedEvent& e) {
        const JobResult& r = e.result;
        if (r.outcome == JobState::Succeeded) {
            print_bar(1.0);
        }
        if (bar_open_) {
            std::cerr << "\n";
            bar_open_ = false;
        }
        const double secs = static_cast<double>(r.elapsed.count()) / 1000.0;
        switch (r.outcome) {
            case JobState::Succeeded:
                std::cerr << (use_colors_ ? GREEN : "") << "[DONE] " << e.input.filename().string()
                          << " (" << human_size(safe_file_size(e.input)) << " -> " << human_size(r.output_size) << ", "
                          << std::fixed << std::setprecision(1) << secs << "s)"
                          << (use_colors_ ? RESET : "") << std::endl;
                break;
            case JobState::Cancelled:
                std::cerr << (use_colors_ ? YELLOW : "") << "[CANCELLED] " << e.input.filename().string()
                          << (use_colors_ ? RESET : "") << std::endl;
                break;
            default:
                std::cerr << (use_colors_ ? RED : "") << "[FAIL] " << e.input.filename().string()
                          << " (" << to_string(r.cause) << "): " << first_line(r.detail)
                          << (use_colors_ ? RESET : "") << std::endl;
                break;
        }
    }));
}

ProgressPrinter::~ProgressPrinter() {
    for (const auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

void ProgressPrinter::print_bar(const double fraction) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);
    const double progress = std::clamp(fraction, 0.0, 1.0);
    const auto pos = static_cast<unsigned>(bar_width * progress);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - job_start_).count();

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && progress < 1.0) std::cerr << ">";
        else if (i == pos) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(3) << static_cast<int>(progress * 100.0) << "%"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed << "s"
              << std::flush;
    bar_open_ = true;
}

void print_run_summary(const RunReport& report, const bool use_colors) {
    if (report.jobs.empty()) {
        return;
    }
    const unsigned term_width = get_terminal_width();
    const size_t max_result = 10;
    const size_t max_size = 12;
    const size_t file_col = term_width > max_result + max_size + 10 ? term_width - max_result - max_size - 2 : 30;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col)) << "Output"
              << std::setw(static_cast<int>(max_size)) << "Size"
              << "Result" << "\n";
    for (const auto& job : report.jobs) {
        const std::string name = job.output_path ? job.output_path->filename().string()
                                                 : job.input.filename().string();
        const char* color = "";
        std::string result(to_string(job.state));
        if (job.state == JobState::Succeeded) color = GREEN;
        else if (job.state == JobState::Cancelled) color = YELLOW;
        else if (job.state == JobState::Failed) color = RED;
        const std::string size = job.result && job.state == JobState::Succeeded
                                     ? human_size(job.result->output_size) : "-";
        std::cerr << std::left << std::setw(static_cast<int>(file_col)) << truncate(name, file_col - 1)
                  << std::setw(static_cast<int>(max_size)) << size
                  << (use_colors ? color : "") << result << (use_colors ? RESET : "") << "\n";
    }
    const auto& s = report.summary;
    std::cerr << "\n" << s.succeeded << " succeeded, " << s.failed << " failed, " << s.cancelled << " cancelled";
    if (report.rejected > 0) {
        std::cerr << ", " << report.rejected << " rejected";
    }
    std::cerr << std::endl;
}
