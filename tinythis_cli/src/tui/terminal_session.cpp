#include "terminal_session.hpp"

#include <cerrno>
#include <system_error>

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

    constexpr std::string_view kAltScreenOn = "\033[?1049h";
    constexpr std::string_view kAltScreenOff = "\033[?1049l";
    constexpr std::string_view kCursorHide = "\033[?25l";
    constexpr std::string_view kCursorShow = "\033[?25h";
    constexpr std::string_view kClearHome = "\033[H\033[2J";

    // bytes of an escape sequence arrive together; a lone ESC is the Esc key
    constexpr std::chrono::milliseconds kEscapeTimeout{30};
    constexpr std::chrono::milliseconds kPromptPoll{200};

    void write_all(const std::string_view s) {
        size_t off = 0;
        while (off < s.size()) {
            const ssize_t n = ::write(STDOUT_FILENO, s.data() + off, s.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return;
            }
            off += static_cast<size_t>(n);
        }
    }

} // namespace

TerminalSession::TerminalSession() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        throw std::system_error(ENOTTY, std::generic_category(), "interactive mode needs a terminal");
    }
    if (tcgetattr(STDIN_FILENO, &original_) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcgetattr");
    }
    enter_raw();
    write_all(kAltScreenOn);
    write_all(kCursorHide);
}

TerminalSession::~TerminalSession() {
    restore();
    write_all(kCursorShow);
    write_all(kAltScreenOff);
}

void TerminalSession::enter_raw() {
    termios raw = original_;
    raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcsetattr");
    }
    raw_ = true;
}

void TerminalSession::restore() {
    if (raw_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
        raw_ = false;
    }
}

std::optional<unsigned char> TerminalSession::read_byte(const std::chrono::milliseconds timeout) const {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc <= 0 || !(pfd.revents & POLLIN)) {
        return std::nullopt;
    }
    unsigned char c = 0;
    if (::read(STDIN_FILENO, &c, 1) != 1) {
        return std::nullopt;
    }
    return c;
}

std::optional<KeyPress> TerminalSession::read_key(const std::chrono::milliseconds timeout) {
    const auto c = read_byte(timeout);
    if (!c) {
        return std::nullopt;
    }
    switch (*c) {
        case '\r':
        case '\n': return KeyPress{Key::Enter};
        case 0x03: return KeyPress{Key::CtrlC};
        case 0x0f: return KeyPress{Key::CtrlO};
        case 0x08:
        case 0x7f: return KeyPress{Key::Backspace};
        case 0x1b: break;
        default:   return KeyPress{Key::Char, static_cast<char>(*c)};
    }

    const auto c1 = read_byte(kEscapeTimeout);
    if (!c1 || (*c1 != '[' && *c1 != 'O')) {
        return KeyPress{Key::Escape};
    }
    const auto c2 = read_byte(kEscapeTimeout);
    if (!c2) {
        return KeyPress{Key::Escape};
    }
    switch (*c2) {
        case 'A': return KeyPress{Key::Up};
        case 'B': return KeyPress{Key::Down};
        case 'C': return KeyPress{Key::Right};
        case 'D': return KeyPress{Key::Left};
        case '3':
            if (const auto tilde = read_byte(kEscapeTimeout); tilde && *tilde == '~') {
                return KeyPress{Key::Delete};
            }
            break;
        default:
            break;
    }
    // unknown sequence: swallow the rest of it
    while (const auto rest = read_byte(kEscapeTimeout)) {
        if ((*rest >= 'A' && *rest <= 'Z') || (*rest >= 'a' && *rest <= 'z') || *rest == '~') break;
    }
    return std::nullopt;
}

std::string LineEditor::feed(const unsigned char c) {
    if (status_ != Status::Editing) {
        return {};
    }
    switch (c) {
        case '\r':
        case '\n':
            status_ = Status::Accepted;
            return "\r\n";
        case 0x03:
        case 0x1b:
            status_ = Status::Cancelled;
            text_.clear();
            return "\r\n";
        case 0x08:
        case 0x7f: {
            if (text_.empty()) return {};
            // drop continuation bytes, then the lead byte
            while (!text_.empty() && (static_cast<unsigned char>(text_.back()) & 0xC0) == 0x80) {
                text_.pop_back();
            }
            if (!text_.empty()) text_.pop_back();
            return "\b \b";
        }
        default:
            break;
    }
    if (c < 0x20) {
        return {};
    }
    text_ += static_cast<char>(c);
    return std::string(1, static_cast<char>(c));
}

std::string TerminalSession::prompt_line(const std::string_view prompt) {
    write_all(kCursorShow);
    write_all("\r\n");
    write_all(prompt);

    LineEditor editor;
    while (editor.status() == LineEditor::Status::Editing) {
        const auto c = read_byte(kPromptPoll);
        if (!c) continue;
        if (*c == 0x1b) {
            // an arrow key is not a cancel; skip its sequence
            if (const auto next = read_byte(kEscapeTimeout)) {
                if (*next == '[' || *next == 'O') {
                    while (const auto rest = read_byte(kEscapeTimeout)) {
                        if ((*rest >= 'A' && *rest <= 'Z') || (*rest >= 'a' && *rest <= 'z') || *rest == '~') break;
                    }
                }
                continue;
            }
        }
        write_all(editor.feed(*c));
    }

    write_all(kCursorHide);
    return editor.text();
}

void TerminalSession::draw(const std::string_view frame) {
    std::string out(kClearHome);
    // raw mode disables output post-processing, so lines need an explicit CR
    for (const char c : frame) {
        if (c == '\n') out += "\r\n";
        else out += c;
    }
    write_all(out);
}

unsigned TerminalSession::columns() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

unsigned TerminalSession::rows() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_row > 0)
        return w.ws_row;
    return 24;
}
