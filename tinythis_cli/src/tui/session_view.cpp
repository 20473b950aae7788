#include "session_view.hpp"
#include "../utils/color.hpp"
#include "../../../libtinythis/include/file_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

using namespace tinythis;

namespace {

    constexpr unsigned kHeaderRows = 3;
    constexpr unsigned kFooterRows = 4;

    std::string fit(const std::string& s, const size_t width) {
        if (s.size() <= width) return s + std::string(width - s.size(), ' ');
        if (width <= 3) return s.substr(0, width);
        return s.substr(0, width - 3) + "...";
    }

    std::string bar(const double fraction, const unsigned width) {
        const auto pos = static_cast<unsigned>(width * std::clamp(fraction, 0.0, 1.0));
        std::string out = "[";
        for (unsigned i = 0; i < width; ++i) {
            out += i < pos ? '=' : (i == pos ? '>' : ' ');
        }
        out += "]";
        return out;
    }

    std::string status_text(const JobSnapshot& job, const unsigned width) {
        std::ostringstream oss;
        switch (job.state) {
            case JobState::Pending:
                oss << "pending";
                break;
            case JobState::Running:
                oss << bar(job.progress, std::max(10u, std::min(30u, width / 3))) << ' '
                    << std::setw(3) << static_cast<int>(job.progress * 100.0) << '%';
                break;
            case JobState::Succeeded:
                oss << "done";
                if (job.output_path) oss << "  " << job.output_path->filename().string();
                break;
            case JobState::Failed:
                oss << "failed";
                if (job.result) {
                    oss << " (" << to_string(job.result->cause) << ")";
                    if (job.result->exit_code) oss << ": exit code " << *job.result->exit_code;
                }
                break;
            case JobState::Cancelled:
                oss << "cancelled";
                break;
        }
        return oss.str();
    }

    const char* state_color(const JobState s) {
        switch (s) {
            case JobState::Running:   return CYAN;
            case JobState::Succeeded: return GREEN;
            case JobState::Failed:    return RED;
            case JobState::Cancelled: return YELLOW;
            case JobState::Pending:   break;
        }
        return "";
    }

} // namespace

std::string render_session(const SessionState& state, const unsigned columns, const unsigned rows, const bool use_colors) {
    const auto c = [use_colors](const char* code) { return use_colors ? code : ""; };
    const unsigned width = std::max(40u, columns);
    std::ostringstream out;

    out << c(BOLD) << "tinythis" << c(RESET)
        << "  preset: < " << to_string(state.preset) << " >"
        << "  accelerator: " << to_string(state.accelerator)
        << "  [" << to_string(state.mode) << "]\n";
    out << std::string(width, '-') << "\n";

    const unsigned list_rows = rows > kHeaderRows + kFooterRows ? rows - kHeaderRows - kFooterRows : 1;
    if (state.jobs.empty()) {
        out << c(DIM) << "no files yet: press a to add, or paste paths" << c(RESET) << "\n";
    } else {
        // keep the selection visible
        const size_t sel = state.selection.value_or(0);
        size_t first = 0;
        if (sel >= list_rows) first = sel - list_rows + 1;
        const size_t last = std::min(state.jobs.size(), first + list_rows);

        const size_t name_width = std::max<size_t>(16, width / 3);
        for (size_t i = first; i < last; ++i) {
            const JobSnapshot& job = state.jobs[i];
            const bool selected = state.selection && *state.selection == i;
            out << (selected ? c(REVERSE) : "") << (selected ? "> " : "  ")
                << fit(job.input.filename().string() + " (" + human_size(job.input_size) + ")", name_width) << ' '
                << fit(std::string(to_string(job.preset)), 9)
                << fit(std::string(to_string(job.accelerator)), 4)
                << (selected ? c(RESET) : "")
                << c(state_color(job.state)) << status_text(job, width) << c(RESET) << "\n";
        }
    }

    out << std::string(width, '-') << "\n";
    if (!state.banner.empty()) {
        out << c(BOLD) << state.banner << c(RESET) << "\n";
    } else {
        out << "\n";
    }
    if (state.mode == SessionMode::Compressing) {
        out << c(DIM) << "esc cancel   q quit" << c(RESET);
    } else {
        out << c(DIM) << "a add   x remove   up/down select   left/right preset   g gpu   enter run   r retry   c clear done   q quit"
            << c(RESET);
    }
    return out.str();
}
