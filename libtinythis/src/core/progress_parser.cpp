#include "../../include/progress_parser.hpp"

#include <algorithm>
#include <charconv>

namespace tinythis {

namespace {

    std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    std::optional<std::uint64_t> parse_u64(std::string_view s) {
        s = trim(s);
        std::uint64_t v = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return v;
    }

} // namespace

std::optional<std::uint64_t> ProgressParser::parse_timestamp_us(std::string_view text) {
    text = trim(text);
    const auto c1 = text.find(':');
    if (c1 == std::string_view::npos) return std::nullopt;
    const auto c2 = text.find(':', c1 + 1);
    if (c2 == std::string_view::npos) return std::nullopt;

    const auto h = parse_u64(text.substr(0, c1));
    const auto m = parse_u64(text.substr(c1 + 1, c2 - c1 - 1));
    std::string_view sec_part = text.substr(c2 + 1);

    std::string_view frac;
    if (const auto dot = sec_part.find('.'); dot != std::string_view::npos) {
        frac = sec_part.substr(dot + 1);
        sec_part = sec_part.substr(0, dot);
    }
    const auto s = parse_u64(sec_part);
    if (!h || !m || !s) return std::nullopt;

    std::uint64_t us = (*h * 3600 + *m * 60 + *s) * 1'000'000ULL;
    if (!frac.empty()) {
        std::string digits(frac.substr(0, std::min<size_t>(frac.size(), 6)));
        digits.resize(6, '0');
        const auto f = parse_u64(digits);
        if (!f) return std::nullopt;
        us += *f;
    }
    return us;
}

std::optional<std::uint64_t> ProgressParser::parse_duration_line(const std::string_view line) {
    constexpr std::string_view kKey = "Duration: ";
    const auto idx = line.find(kKey);
    if (idx == std::string_view::npos) return std::nullopt;
    std::string_view after = line.substr(idx + kKey.size());
    after = after.substr(0, after.find(','));
    return parse_timestamp_us(after);
}

void ProgressParser::feed_diagnostic(const std::string_view line) {
    if (!total_us_) {
        if (const auto us = parse_duration_line(line); us && *us > 0) {
            total_us_ = us;
        }
    }
    tail_.emplace_back(line);
    while (tail_.size() > kDiagnosticTailLines) {
        tail_.pop_front();
    }
}

std::optional<ProgressEvent> ProgressParser::feed_progress(const std::string_view line) {
    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view key = trim(line.substr(0, eq));
    const std::string_view value = trim(line.substr(eq + 1));

    if (key == "frame") {
        if (const auto v = parse_u64(value)) current_.frame = *v;
    } else if (key == "out_time_us" || key == "out_time_ms") {
        // out_time_ms is also microseconds; N/A and negative values are skipped
        if (const auto v = parse_u64(value)) current_.out_time_us = *v;
    } else if (key == "out_time") {
        if (const auto v = parse_timestamp_us(value)) current_.out_time_us = *v;
    } else if (key == "progress") {
        current_.ended = value == "end";
        update_fraction();
        current_.fraction = fraction_;
        return current_;
    }
    return std::nullopt;
}

void ProgressParser::update_fraction() {
    if (!total_us_ || *total_us_ == 0) {
        return;
    }
    const double raw = static_cast<double>(current_.out_time_us) / static_cast<double>(*total_us_);
    const double capped = std::clamp(raw, 0.0, kMaxRunningFraction);
    fraction_ = std::max(fraction_, capped);
}

std::string ProgressParser::diagnostic_tail() const {
    std::string out;
    for (const auto& l : tail_) {
        if (!out.empty()) out.push_back('\n');
        out += l;
    }
    return out;
}

std::optional<ProgressEvent> ProgressStream::next(const std::stop_token& stop) {
    const auto on_line = [this](const OutputChannel channel, const std::string_view line) {
        if (channel == OutputChannel::Stderr) {
            parser_.feed_diagnostic(line);
        } else if (auto ev = parser_.feed_progress(line)) {
            ready_.push_back(*ev);
        }
    };

    while (ready_.empty() && !exhausted_) {
        if (stop.stop_requested()) {
            return std::nullopt;
        }
        if (!process_.read_lines(kPollInterval, on_line)) {
            exhausted_ = true;
            break;
        }
        // a grandchild may keep the pipes open after the encoder exits
        if (ready_.empty() && process_.try_wait()) {
            process_.read_lines(std::chrono::milliseconds(0), on_line);
            exhausted_ = true;
        }
    }

    if (ready_.empty()) {
        return std::nullopt;
    }
    ProgressEvent ev = ready_.front();
    ready_.pop_front();
    return ev;
}

} // namespace tinythis
