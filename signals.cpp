#include "signals.h"
#include <cstring>

static volatile sig_atomic_t g_resized = 0;
static volatile sig_atomic_t g_terminate = 0;

static void resize_handler(int /*signal*/) {
    g_resized = 1;
}

static void terminate_handler(int /*signal*/) {
    g_terminate = 1;
}

namespace signals {

bool consume_resize() {
    if (g_resized == 0) {
        return false;
    }
    g_resized = 0;
    return true;
}

bool termination_requested() {
    return g_terminate != 0;
}

void raise_resize_flag() {
    g_resized = 1;
}

void clear_flags() {
    g_resized = 0;
    g_terminate = 0;
}

} // namespace signals

SignalBridge::SignalBridge()
    : installed_(false) {
    std::memset(&old_winch_, 0, sizeof(old_winch_));
    std::memset(&old_int_, 0, sizeof(old_int_));
    std::memset(&old_term_, 0, sizeof(old_term_));
    std::memset(&old_hup_, 0, sizeof(old_hup_));

    signals::clear_flags();

    struct sigaction winch;
    std::memset(&winch, 0, sizeof(winch));
    winch.sa_handler = resize_handler;
    sigemptyset(&winch.sa_mask);
    winch.sa_flags = 0; // no SA_RESTART

    struct sigaction term;
    std::memset(&term, 0, sizeof(term));
    term.sa_handler = terminate_handler;
    sigemptyset(&term.sa_mask);
    term.sa_flags = 0;

    installed_ = sigaction(SIGWINCH, &winch, &old_winch_) == 0 &&
                 sigaction(SIGINT, &term, &old_int_) == 0 &&
                 sigaction(SIGTERM, &term, &old_term_) == 0 &&
                 sigaction(SIGHUP, &term, &old_hup_) == 0;
}

SignalBridge::~SignalBridge() {
    sigaction(SIGWINCH, &old_winch_, nullptr);
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
}
