#pragma once

#include <atomic>
#include <string>

namespace platform {

// Get terminal width (80 when stdout is not a tty).
int term_width();

// True when stdout is an interactive terminal.
bool stdout_is_tty();

// RAII guard that turns off echo and canonical mode on stdin.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Prompt and read a line without echoing it (API keys).
std::string read_secret(const std::string& prompt);

// SIGINT / SIGTERM set *flag instead of killing the process.
void install_interrupt_flag(std::atomic<bool>* flag);

} // namespace platform
