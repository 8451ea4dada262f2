#include "keys.h"
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <unistd.h>

std::string key_name(const Key& key) {
    switch (key.type) {
        case Key::Type::ArrowUp: return "ArrowUp";
        case Key::Type::ArrowDown: return "ArrowDown";
        case Key::Type::ArrowLeft: return "ArrowLeft";
        case Key::Type::ArrowRight: return "ArrowRight";
        case Key::Type::Enter: return "Enter";
        case Key::Type::Tab: return "Tab";
        case Key::Type::BackTab: return "BackTab";
        case Key::Type::Backspace: return "Backspace";
        case Key::Type::Escape: return "Escape";
        case Key::Type::Char: return std::string("Char('") + key.ch + "')";
        case Key::Type::Unknown: return "Unknown";
    }
    return "Unknown";
}

ReadStatus FdByteSource::read_byte(uint8_t& byte) {
    while (true) {
        uint8_t buf = 0;
        ssize_t n = ::read(fd_, &buf, 1);
        if (n == 1) {
            byte = buf;
            return ReadStatus::Ok;
        }
        if (n == 0) {
            return ReadStatus::Eof;
        }
        if (errno == EINTR) {
            continue; // retry on signal interrupt only
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadStatus::WouldBlock;
        }
        return ReadStatus::Error;
    }
}

bool FdByteSource::read_byte_timeout(int timeout_ms, uint8_t& byte) {
    // A signal (SIGWINCH during a resize) must not cut the wait short, or the
    // rest of an escape sequence would be decoded as separate keys
    const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        std::chrono::steady_clock::duration left = deadline - std::chrono::steady_clock::now();
        int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(left).count());
        if (wait_ms < 0) {
            wait_ms = 0;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            return false;
        }

        uint8_t buf = 0;
        ssize_t n = ::read(fd_, &buf, 1);
        if (n == 1) {
            byte = buf;
            return true;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Spurious POLLIN or interrupted read: keep waiting out the deadline
            if (wait_ms == 0) {
                return false;
            }
            continue;
        }
        return false;
    }
}

KeyDecoder::KeyDecoder(ByteSource& source, int escape_timeout_ms)
    : source_(source)
    , escape_timeout_ms_(escape_timeout_ms) {
}

ReadStatus KeyDecoder::read_key(Key& key) {
    uint8_t b = 0;
    ReadStatus status = source_.read_byte(b);
    if (status != ReadStatus::Ok) {
        return status;
    }

    if (b == '\r' || b == '\n') {
        key = Key(Key::Type::Enter);
    } else if (b == '\t') {
        key = Key(Key::Type::Tab);
    } else if (b == 0x7f || b == 0x08) {
        key = Key(Key::Type::Backspace);
    } else if (b == 0x1b) {
        key = decode_escape();
    } else if (b >= 0x01 && b <= 0x1a) {
        key = Key(Key::Type::Unknown); // other ctrl chars
    } else if (b >= ' ' && b <= '~') {
        key = Key::character(static_cast<char>(b));
    } else {
        key = Key(Key::Type::Unknown);
    }
    return ReadStatus::Ok;
}

Key KeyDecoder::decode_escape() {
    uint8_t next = 0;
    if (!source_.read_byte_timeout(escape_timeout_ms_, next)) {
        return Key(Key::Type::Escape);
    }
    if (next == '[') {
        return decode_csi();
    }
    if (next == 'O') {
        return decode_ss3();
    }
    return Key(Key::Type::Unknown); // Alt+key
}

Key KeyDecoder::decode_csi() {
    uint8_t b = 0;
    if (!source_.read_byte_timeout(escape_timeout_ms_, b)) {
        return Key(Key::Type::Unknown);
    }

    switch (b) {
        case 'A': return Key(Key::Type::ArrowUp);
        case 'B': return Key(Key::Type::ArrowDown);
        case 'C': return Key(Key::Type::ArrowRight);
        case 'D': return Key(Key::Type::ArrowLeft);
        case 'Z': return Key(Key::Type::BackTab);
        default: break;
    }

    if (b >= '0' && b <= '9') {
        // Parameterized sequence (e.g. ESC [ 3 ~ or ESC [ 1 ; 5 C): drain up to the final byte
        uint8_t last = b;
        while (last < 0x40 || last > 0x7e) {
            if (!source_.read_byte_timeout(escape_timeout_ms_, last)) {
                break;
            }
        }
    }
    return Key(Key::Type::Unknown);
}

Key KeyDecoder::decode_ss3() {
    uint8_t b = 0;
    if (!source_.read_byte_timeout(escape_timeout_ms_, b)) {
        return Key(Key::Type::Unknown);
    }

    switch (b) {
        case 'A': return Key(Key::Type::ArrowUp);
        case 'B': return Key(Key::Type::ArrowDown);
        case 'C': return Key(Key::Type::ArrowRight);
        case 'D': return Key(Key::Type::ArrowLeft);
        default: return Key(Key::Type::Unknown);
    }
}
