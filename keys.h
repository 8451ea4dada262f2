#ifndef KEYS_H
#define KEYS_H

#include <cstdint>
#include <string>

// Byte-level keyboard decoding for raw-mode terminals
// Reference: ECMA-48 (CSI sequences), VT100 cursor key modes (CSI and SS3)

struct Key {
    enum class Type {
        ArrowUp,
        ArrowDown,
        ArrowLeft,
        ArrowRight,
        Enter,
        Tab,
        BackTab,
        Backspace,
        Escape,
        Char,
        Unknown
    };

    Type type;
    char ch; // only meaningful for Type::Char

    Key() : type(Type::Unknown), ch(0) {}
    explicit Key(Type t) : type(t), ch(0) {}

    static Key character(char c) {
        Key key(Type::Char);
        key.ch = c;
        return key;
    }

    bool is_char(char c) const { return type == Type::Char && ch == c; }

    bool operator==(const Key& other) const {
        return type == other.type && (type != Type::Char || ch == other.ch);
    }
    bool operator!=(const Key& other) const { return !(*this == other); }
};

// Debug name, e.g. "ArrowUp" or "Char('x')"
std::string key_name(const Key& key);

enum class ReadStatus {
    Ok,
    WouldBlock, // no data yet, nothing consumed
    Eof,
    Error
};

// Where the decoder pulls bytes from
class ByteSource {
public:
    virtual ~ByteSource() {}

    // Non-blocking single byte read; interrupted reads are retried
    virtual ReadStatus read_byte(uint8_t& byte) = 0;

    // Wait up to timeout_ms for one byte; false on timeout or no data
    virtual bool read_byte_timeout(int timeout_ms, uint8_t& byte) = 0;
};

// Reads from a non-blocking file descriptor
class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd) : fd_(fd) {}

    ReadStatus read_byte(uint8_t& byte) override;
    bool read_byte_timeout(int timeout_ms, uint8_t& byte) override;

private:
    int fd_;
};

class KeyDecoder {
public:
    explicit KeyDecoder(ByteSource& source, int escape_timeout_ms = 50);

    // Decode exactly one key. Anything but ReadStatus::Ok leaves key untouched.
    ReadStatus read_key(Key& key);

private:
    ByteSource& source_;
    int escape_timeout_ms_;

    Key decode_escape();
    Key decode_csi();
    Key decode_ss3();
};

#endif // KEYS_H
