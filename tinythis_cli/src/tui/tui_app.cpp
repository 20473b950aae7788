#include "tui_app.hpp"
#include "paste_paths.hpp"
#include "session_view.hpp"
#include "terminal_session.hpp"
#include "../cli/options_file.hpp"
#include "../../../libtinythis/include/event_bus.hpp"
#include "../../../libtinythis/include/events.hpp"
#include "../../../libtinythis/include/job_queue.hpp"
#include "../../../libtinythis/include/logger.hpp"
#include "../../../libtinythis/include/session_controller.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

using namespace tinythis;

namespace {

    constexpr std::chrono::milliseconds kFrameInterval{100};
    constexpr std::chrono::milliseconds kPasteGap{30};

    bool starts_paste(const char c) {
        return c == '/' || c == '\'' || c == '"' || c == '~';
    }

    // a paste arrives as a burst of characters; collect until the burst ends
    std::string collect_paste(TerminalSession& term, const char first) {
        std::string text(1, first);
        while (const auto k = term.read_key(kPasteGap)) {
            if (k->key == Key::Char) {
                text.push_back(k->ch);
            } else {
                break;
            }
        }
        return text;
    }

    void add_from_text(SessionController& session, const std::string& text) {
        std::vector<std::filesystem::path> paths;
        for (auto& p : parse_paste_paths(text)) {
            const std::string s = p.string();
            if (s.starts_with("~/")) {
                if (const char* home = std::getenv("HOME")) {
                    p = std::filesystem::path(home) / s.substr(2);
                }
            }
            paths.push_back(std::move(p));
        }
        session.add_files(paths);
    }

    bool dispatch(SessionController& session, TerminalSession& term, const KeyPress& key) {
        switch (key.key) {
            case Key::Up:        return session.handle(SessionEvent::SelectPrev);
            case Key::Down:      return session.handle(SessionEvent::SelectNext);
            case Key::Left:      return session.handle(SessionEvent::PresetPrev);
            case Key::Right:     return session.handle(SessionEvent::PresetNext);
            case Key::Enter:     return session.handle(SessionEvent::Run);
            case Key::Escape:    return session.handle(SessionEvent::Back);
            case Key::Backspace:
            case Key::Delete:    return session.handle(SessionEvent::RemoveSelected);
            case Key::CtrlC:     return session.handle(SessionEvent::Quit);
            case Key::CtrlO:
                add_from_text(session, term.prompt_line("add files (paths, quoted if they contain spaces): "));
                return true;
            case Key::Char:
                break;
        }

        switch (key.ch) {
            case 'a':
                add_from_text(session, term.prompt_line("add files (paths, quoted if they contain spaces): "));
                return true;
            case 'x': return session.handle(SessionEvent::RemoveSelected);
            case 'k': return session.handle(SessionEvent::SelectPrev);
            case 'j': return session.handle(SessionEvent::SelectNext);
            case 'h': return session.handle(SessionEvent::PresetPrev);
            case 'l': return session.handle(SessionEvent::PresetNext);
            case 'g': return session.handle(SessionEvent::ToggleAccelerator);
            case 'r': return session.handle(SessionEvent::RetrySelected);
            case 'c': return session.handle(SessionEvent::ClearFinished);
            case 'q': return session.handle(SessionEvent::Quit);
            default:
                break;
        }
        if (starts_paste(key.ch) && session.state().mode == SessionMode::Browsing) {
            add_from_text(session, collect_paste(term, key.ch));
            return true;
        }
        return false;
    }

} // namespace

int run_tui(const IEncoderLocator& locator, const TuiOptions& options, const std::atomic<bool>& stop) {
    EventBus bus;
    JobQueue queue(locator, bus);
    SessionController session(queue, options.preset, options.accelerator);

    if (options.options_file) {
        const std::filesystem::path file = *options.options_file;
        session.set_accelerator_listener([file](const AcceleratorMode mode) {
            try {
                save_gpu_preference(file, mode == AcceleratorMode::Gpu);
            } catch (const std::filesystem::filesystem_error& e) {
                Logger::log(LogLevel::Warning, std::string("can't save options: ") + e.what(), "tui");
            }
        });
    }

    bus.subscribe<JobFinishedEvent>([](const JobFinishedEvent& e) {
        if (e.result.outcome == JobState::Failed) {
            Logger::log(LogLevel::Error, e.input.string() + ": " + e.result.detail, "tui");
        }
    });

    if (!locator.locate()) {
        Logger::log(LogLevel::Warning, "no encoder available yet", "tui");
    }

    TerminalSession term;
    bool dirty = true;
    while (!session.state().quit) {
        if (stop.load()) {
            session.handle(SessionEvent::Quit);
            break;
        }
        if (dirty) {
            term.draw(render_session(session.state(), term.columns(), term.rows(), options.use_colors));
            dirty = false;
        }
        if (session.tick()) {
            dirty = true;
        }
        if (const auto key = term.read_key(kFrameInterval)) {
            dirty = dispatch(session, term, *key) || dirty;
        }
    }
    return 0;
}
