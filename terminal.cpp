#include "terminal.h"
#include "signals.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>

namespace terminal {

std::string move_to(int row, int col) {
    return "\033[" + std::to_string(row) + ";" + std::to_string(col) + "H";
}

} // namespace terminal

TerminalSession::TerminalSession()
    : fd_(-1)
    , raw_active_(false)
    , have_original_(false)
    , original_flags_(0) {
    std::memset(&original_, 0, sizeof(original_));
}

TerminalSession::~TerminalSession() {
    close();
}

bool TerminalSession::open(const std::string& device) {
    if (fd_ >= 0) {
        return true;
    }

    int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        last_error_ = "failed to open " + device + ": " + std::strerror(errno);
        return false;
    }
    if (!isatty(fd)) {
        last_error_ = device + " is not a terminal";
        ::close(fd);
        return false;
    }

    fd_ = fd;
    last_error_.clear();
    return true;
}

void TerminalSession::close() {
    if (fd_ < 0) {
        return;
    }
    leave_raw();
    ::close(fd_);
    fd_ = -1;
}

bool TerminalSession::enter_raw() {
    if (fd_ < 0) {
        last_error_ = "terminal is not open";
        return false;
    }
    if (raw_active_) {
        return true;
    }

    struct termios orig;
    if (tcgetattr(fd_, &orig) != 0) {
        last_error_ = std::string("tcgetattr failed: ") + std::strerror(errno);
        return false;
    }
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
        last_error_ = std::string("fcntl(F_GETFL) failed: ") + std::strerror(errno);
        return false;
    }

    // Snapshot is taken before anything changes so leave_raw() can always undo
    original_ = orig;
    original_flags_ = flags;
    have_original_ = true;

    struct termios raw = orig;
    cfmakeraw(&raw);
    raw.c_oflag |= OPOST;
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
        last_error_ = std::string("tcsetattr failed: ") + std::strerror(errno);
        return false;
    }
    raw_active_ = true;

    if (fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
        last_error_ = std::string("fcntl(F_SETFL) failed: ") + std::strerror(errno);
        leave_raw();
        return false;
    }

    return true;
}

void TerminalSession::leave_raw() {
    if (!raw_active_ || !have_original_ || fd_ < 0) {
        return;
    }

    if (tcsetattr(fd_, TCSANOW, &original_) != 0) {
        Logger::instance().log(LogLevel::WARN, std::string("Failed to restore terminal mode: ") + std::strerror(errno));
    }
    if (fcntl(fd_, F_SETFL, original_flags_) != 0) {
        Logger::instance().log(LogLevel::WARN, std::string("Failed to restore terminal flags: ") + std::strerror(errno));
    }
    raw_active_ = false;
}

void TerminalSession::get_size(int& rows, int& cols) const {
    struct winsize w;
    if (fd_ >= 0 && ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_row > 0 && w.ws_col > 0) {
        rows = w.ws_row;
        cols = w.ws_col;
        return;
    }
    rows = terminal::DEFAULT_ROWS;
    cols = terminal::DEFAULT_COLS;
}

bool TerminalSession::write_all(const std::string& data) {
    if (fd_ < 0) {
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t ret = ::write(fd_, data.data() + offset, data.size() - offset);
        if (ret > 0) {
            offset += static_cast<size_t>(ret);
            continue;
        }
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Non-blocking descriptor: wait until writable, then retry
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            poll(&pfd, 1, 100);
            continue;
        }
        last_error_ = std::string("write failed: ") + (ret < 0 ? std::strerror(errno) : "no progress");
        return false;
    }
    return true;
}

int TerminalSession::wait_readable(int timeout_ms) const {
    if (fd_ < 0) {
        return -1;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0) {
        return -1;
    }
    if (result == 0) {
        return 0;
    }
    return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) ? 1 : 0;
}

bool TerminalSession::read_line(const std::string& prompt, std::string& line) {
    if (fd_ < 0 || raw_active_) {
        last_error_ = "line prompt requires the terminal in canonical mode";
        return false;
    }
    if (!write_all(prompt)) {
        return false;
    }

    line.clear();
    while (true) {
        char c = 0;
        ssize_t n = ::read(fd_, &c, 1);
        if (n == 1) {
            if (c == '\n') {
                return true;
            }
            line += c;
            continue;
        }
        if (n == 0) {
            // EOF (Ctrl+D on an empty line) ends the prompt with what was typed
            return !line.empty();
        }
        if (errno == EINTR) {
            if (signals::termination_requested()) {
                return false;
            }
            continue;
        }
        last_error_ = std::string("read failed: ") + std::strerror(errno);
        return false;
    }
}

RawModeGuard::RawModeGuard(TerminalSession& session)
    : session_(session)
    , active_(session.enter_raw()) {
}

RawModeGuard::~RawModeGuard() {
    session_.leave_raw();
}

ScreenGuard::ScreenGuard(TerminalSession& session)
    : session_(session) {
    session_.write_all(std::string(terminal::HIDE_CURSOR) + terminal::ENTER_ALT_SCREEN);
}

ScreenGuard::~ScreenGuard() {
    session_.write_all(std::string(terminal::RESET_ATTRIBUTES) + terminal::LEAVE_ALT_SCREEN + terminal::SHOW_CURSOR);
}

CookedModeScope::CookedModeScope(TerminalSession& session)
    : session_(session)
    , was_raw_(session.is_raw()) {
    session_.write_all(std::string(terminal::RESET_SCROLL_REGION) + terminal::CLEAR_SCREEN + terminal::SHOW_CURSOR);
    session_.leave_raw();
}

CookedModeScope::~CookedModeScope() {
    session_.write_all(terminal::HIDE_CURSOR);
    if (was_raw_ && !session_.enter_raw()) {
        Logger::instance().log(LogLevel::ERROR_LEVEL, "Failed to re-enter raw mode: " + session_.last_error());
    }
}
