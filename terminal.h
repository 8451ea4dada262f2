#ifndef TERMINAL_H
#define TERMINAL_H

#include <string>
#include <termios.h>

// Controlling-terminal access for the form (POSIX termios + ANSI/VT100 sequences)
// Reference: POSIX.1-2008 General Terminal Interface, ECMA-48 control functions

namespace terminal {

static const char* const ENTER_ALT_SCREEN = "\033[?1049h";
static const char* const LEAVE_ALT_SCREEN = "\033[?1049l";
static const char* const HIDE_CURSOR = "\033[?25l";
static const char* const SHOW_CURSOR = "\033[?25h";
static const char* const RESET_SCROLL_REGION = "\033[r";
static const char* const CLEAR_LINE = "\033[2K";
static const char* const CLEAR_SCREEN = "\033[H\033[2J\033[3J";
static const char* const RESET_ATTRIBUTES = "\033[0m";

static const int DEFAULT_ROWS = 24;
static const int DEFAULT_COLS = 80;

// Absolute cursor position, 1-based
std::string move_to(int row, int col);

} // namespace terminal

// Owns the terminal file descriptor and its original mode.
// Raw mode is always restored before the descriptor is closed.
class TerminalSession {
public:
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    // Open the device read+write; false (with last_error) if unavailable
    bool open(const std::string& device);
    void close();
    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }

    // Capture the current mode, switch to raw + non-blocking.
    // Output post-processing stays on so "\n" still becomes "\r\n".
    bool enter_raw();

    // Restore the captured mode and descriptor flags. Safe to call repeatedly.
    void leave_raw();
    bool is_raw() const { return raw_active_; }

    // Window size via TIOCGWINSZ, 24x80 if the query fails
    void get_size(int& rows, int& cols) const;

    // Write everything, retrying on EINTR and EAGAIN
    bool write_all(const std::string& data);

    // Wait for input: 1 readable, 0 timeout, -1 interrupted or failed
    int wait_readable(int timeout_ms) const;

    // Line prompt in the terminal's canonical mode (kernel line editing).
    // Must be called while raw mode is off. False on EOF, error or termination signal.
    bool read_line(const std::string& prompt, std::string& line);

    const std::string& last_error() const { return last_error_; }

private:
    int fd_;
    bool raw_active_;
    bool have_original_;
    struct termios original_;
    int original_flags_;
    std::string last_error_;
};

// Raw mode for the lifetime of the guard
class RawModeGuard {
public:
    explicit RawModeGuard(TerminalSession& session);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return active_; }

private:
    TerminalSession& session_;
    bool active_;
};

// Alternate screen buffer + hidden cursor for the lifetime of the guard
class ScreenGuard {
public:
    explicit ScreenGuard(TerminalSession& session);
    ~ScreenGuard();

    ScreenGuard(const ScreenGuard&) = delete;
    ScreenGuard& operator=(const ScreenGuard&) = delete;

private:
    TerminalSession& session_;
};

// Temporarily hands the terminal back to canonical mode with a visible cursor.
// Raw mode and the hidden cursor come back when the scope ends.
class CookedModeScope {
public:
    explicit CookedModeScope(TerminalSession& session);
    ~CookedModeScope();

    CookedModeScope(const CookedModeScope&) = delete;
    CookedModeScope& operator=(const CookedModeScope&) = delete;

private:
    TerminalSession& session_;
    bool was_raw_;
};

#endif // TERMINAL_H
