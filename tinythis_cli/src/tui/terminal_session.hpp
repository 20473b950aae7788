#ifndef TINYTHIS_TERMINAL_SESSION_HPP
#define TINYTHIS_TERMINAL_SESSION_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <termios.h>

enum class Key {
    Char,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    Backspace,
    Delete,
    CtrlC,
    CtrlO
};

struct KeyPress {
    Key key = Key::Char;
    char ch = 0;  ///< Valid for Key::Char
};

/**
 * @brief Single-line input built from raw key bytes.
 *
 * Enter accepts, Esc or Ctrl-C cancels, Backspace removes the last UTF-8
 * character. Other control bytes are ignored.
 */
class LineEditor {
public:
    enum class Status { Editing, Accepted, Cancelled };

    /// Applies one byte and returns the bytes that echo it on the terminal.
    std::string feed(unsigned char c);

    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string text_;
    Status status_ = Status::Editing;
};

/**
 * @brief RAII owner of the terminal while the TUI runs.
 *
 * @details Switches stdin to raw mode (no echo, no line buffering, no
 * signal keys), enters the alternate screen and hides the cursor. The
 * destructor restores everything, including when the TUI unwinds through
 * an exception.
 */
class TerminalSession {
public:
    /// @throws std::system_error if stdin is not a terminal.
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    /// Waits up to @p timeout for one key press.
    std::optional<KeyPress> read_key(std::chrono::milliseconds timeout);

    /**
     * @brief Reads one line below @p prompt, echoing it through a LineEditor.
     * Stays in raw mode, so bytes after the Enter remain for read_key().
     * Returns an empty string when the prompt is cancelled.
     */
    std::string prompt_line(std::string_view prompt);

    /// Replaces the whole screen with @p frame.
    void draw(std::string_view frame);

    [[nodiscard]] unsigned columns() const;
    [[nodiscard]] unsigned rows() const;

private:
    void enter_raw();
    void restore();
    [[nodiscard]] std::optional<unsigned char> read_byte(std::chrono::milliseconds timeout) const;

    termios original_{};
    bool raw_ = false;
};

#endif // TINYTHIS_TERMINAL_SESSION_HPP
