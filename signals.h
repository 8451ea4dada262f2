#ifndef SIGNALS_H
#define SIGNALS_H

#include <csignal>

// Process-wide flags set by async-signal-safe handlers and polled by the form loop.
// Handlers only store a flag; the loop reads and clears.

namespace signals {

// True once since the last call if SIGWINCH arrived; clears the flag
bool consume_resize();

// True if SIGINT, SIGTERM or SIGHUP arrived while a SignalBridge was installed
bool termination_requested();

// Test hook: behave as if the signal had been delivered
void raise_resize_flag();
void clear_flags();

} // namespace signals

// Installs the handlers for its lifetime and restores the previous dispositions after.
// Handlers are installed without SA_RESTART so a blocking poll() returns EINTR promptly.
class SignalBridge {
public:
    SignalBridge();
    ~SignalBridge();

    SignalBridge(const SignalBridge&) = delete;
    SignalBridge& operator=(const SignalBridge&) = delete;

    bool installed() const { return installed_; }

private:
    struct sigaction old_winch_;
    struct sigaction old_int_;
    struct sigaction old_term_;
    struct sigaction old_hup_;
    bool installed_;
};

#endif // SIGNALS_H
