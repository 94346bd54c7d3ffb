#include "terminal.hpp"
#include <iostream>
#include <csignal>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── stdin ────────────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

std::string read_secret(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    if (!isatty(STDIN_FILENO)) {
        std::string line;
        std::getline(std::cin, line);
        return line;
    }

    NoEchoGuard guard;

    std::string secret;
    while (true) {
        if (!poll_stdin(60000)) break;  // 60s timeout
        char c;
        if (read(STDIN_FILENO, &c, 1) != 1) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!secret.empty()) secret.pop_back();
            continue;
        }
        if (c >= 32) secret += c;
    }

    std::cout << "\n";
    return secret;
}

// ── Signals ──────────────────────────────────────────────────

static std::atomic<bool>* g_interrupt_flag = nullptr;

static void on_interrupt(int) {
    if (g_interrupt_flag) g_interrupt_flag->store(true);
}

void install_interrupt_flag(std::atomic<bool>* flag) {
    g_interrupt_flag = flag;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
}

} // namespace platform
