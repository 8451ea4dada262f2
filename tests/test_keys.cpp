#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include "keys.h"
#include "test_helpers.h"

// ============================================================================
// Single-byte keys
// ============================================================================

TEST_CASE("enter, tab and backspace") {
    SECTION("carriage return and newline are both Enter") {
        std::vector<Key> keys = decode_all("\r\n");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == Key(Key::Type::Enter));
        CHECK(keys[1] == Key(Key::Type::Enter));
    }
    SECTION("tab") {
        std::vector<Key> keys = decode_all("\t");
        REQUIRE(keys.size() == 1);
        CHECK(keys[0] == Key(Key::Type::Tab));
    }
    SECTION("DEL and BS are both Backspace") {
        std::vector<Key> keys = decode_all(std::string("\x7f\x08", 2));
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == Key(Key::Type::Backspace));
        CHECK(keys[1] == Key(Key::Type::Backspace));
    }
}

TEST_CASE("printable characters") {
    std::vector<Key> keys = decode_all("a Z~");
    REQUIRE(keys.size() == 4);
    CHECK(keys[0].is_char('a'));
    CHECK(keys[1].is_char(' '));
    CHECK(keys[2].is_char('Z'));
    CHECK(keys[3].is_char('~'));
}

TEST_CASE("control and high bytes are Unknown") {
    std::vector<Key> keys = decode_all(std::string("\x01\x03\x1a\x80\xff", 5));
    REQUIRE(keys.size() == 5);
    for (const auto& key : keys) {
        CHECK(key.type == Key::Type::Unknown);
    }
}

TEST_CASE("no input yields WouldBlock and leaves the key alone") {
    ScriptedByteSource source("");
    KeyDecoder decoder(source, 0);
    Key key = Key::character('q');
    CHECK(decoder.read_key(key) == ReadStatus::WouldBlock);
    CHECK(key.is_char('q'));
}

// ============================================================================
// Escape sequences
// ============================================================================

TEST_CASE("lone escape") {
    ScriptedByteSource source("\x1b");
    KeyDecoder decoder(source, 0);
    Key key;
    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::Escape));
    CHECK(source.remaining() == 0);
    CHECK(decoder.read_key(key) == ReadStatus::WouldBlock);
}

TEST_CASE("CSI arrows consume exactly their bytes") {
    ScriptedByteSource source("\x1b[A\x1b[B\x1b[C\x1b[Dx");
    KeyDecoder decoder(source, 0);
    Key key;

    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::ArrowUp));
    CHECK(source.remaining() == 10);

    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::ArrowDown));
    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::ArrowRight));
    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::ArrowLeft));

    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key.is_char('x'));
}

TEST_CASE("SS3 arrows") {
    std::vector<Key> keys = decode_all("\x1bOA\x1bOB\x1bOC\x1bOD");
    REQUIRE(keys.size() == 4);
    CHECK(keys[0] == Key(Key::Type::ArrowUp));
    CHECK(keys[1] == Key(Key::Type::ArrowDown));
    CHECK(keys[2] == Key(Key::Type::ArrowRight));
    CHECK(keys[3] == Key(Key::Type::ArrowLeft));
}

TEST_CASE("shift-tab") {
    std::vector<Key> keys = decode_all("\x1b[Z");
    REQUIRE(keys.size() == 1);
    CHECK(keys[0] == Key(Key::Type::BackTab));
}

TEST_CASE("parameterized CSI is drained to its final byte") {
    SECTION("delete key") {
        std::vector<Key> keys = decode_all("\x1b[3~q");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0].type == Key::Type::Unknown);
        CHECK(keys[1].is_char('q'));
    }
    SECTION("ctrl-right with modifiers") {
        std::vector<Key> keys = decode_all("\x1b[1;5Cq");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0].type == Key::Type::Unknown);
        CHECK(keys[1].is_char('q'));
    }
    SECTION("truncated sequence stops at end of input") {
        std::vector<Key> keys = decode_all("\x1b[12");
        REQUIRE(keys.size() == 1);
        CHECK(keys[0].type == Key::Type::Unknown);
    }
}

TEST_CASE("other bytes after escape are Unknown") {
    SECTION("alt-x") {
        std::vector<Key> keys = decode_all("\x1bxy");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0].type == Key::Type::Unknown);
        CHECK(keys[1].is_char('y'));
    }
    SECTION("unmapped CSI final byte") {
        std::vector<Key> keys = decode_all("\x1b[Hy");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0].type == Key::Type::Unknown);
        CHECK(keys[1].is_char('y'));
    }
    SECTION("unmapped SS3 final byte") {
        std::vector<Key> keys = decode_all("\x1bOPy");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0].type == Key::Type::Unknown);
        CHECK(keys[1].is_char('y'));
    }
}

TEST_CASE("key names") {
    CHECK(key_name(Key(Key::Type::ArrowUp)) == "ArrowUp");
    CHECK(key_name(Key(Key::Type::BackTab)) == "BackTab");
    CHECK(key_name(Key::character('x')) == "Char('x')");
    CHECK(Key::character('a') != Key::character('b'));
    CHECK(Key(Key::Type::Enter) != Key(Key::Type::Tab));
}

// ============================================================================
// File descriptor source
// ============================================================================

static volatile sig_atomic_t g_interrupts = 0;

static void count_interrupt(int /*signal*/) {
    g_interrupts = g_interrupts + 1;
}

TEST_CASE("signal during an escape sequence does not split it") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    REQUIRE(fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK) == 0);

    // Same disposition as the form loop: no SA_RESTART, so poll() sees EINTR
    struct sigaction action;
    struct sigaction previous;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = count_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    REQUIRE(sigaction(SIGUSR1, &action, &previous) == 0);
    g_interrupts = 0;

    REQUIRE(write(fds[1], "\x1b", 1) == 1);

    pthread_t reader = pthread_self();
    std::thread writer([reader, &fds]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        pthread_kill(reader, SIGUSR1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ssize_t written = write(fds[1], "[A", 2);
        (void)written;
    });

    FdByteSource source(fds[0]);
    KeyDecoder decoder(source, 200);
    Key key;
    ReadStatus status = decoder.read_key(key);
    writer.join();

    sigaction(SIGUSR1, &previous, nullptr);
    close(fds[0]);
    close(fds[1]);

    REQUIRE(status == ReadStatus::Ok);
    CHECK(g_interrupts == 1);
    CHECK(key == Key(Key::Type::ArrowUp));
}

TEST_CASE("fd source times out without data") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    REQUIRE(fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK) == 0);
    REQUIRE(write(fds[1], "\x1b", 1) == 1);

    FdByteSource source(fds[0]);
    KeyDecoder decoder(source, 10);
    Key key;
    REQUIRE(decoder.read_key(key) == ReadStatus::Ok);
    CHECK(key == Key(Key::Type::Escape));
    CHECK(decoder.read_key(key) == ReadStatus::WouldBlock);

    close(fds[1]);
    CHECK(decoder.read_key(key) == ReadStatus::Eof);
    close(fds[0]);
}
