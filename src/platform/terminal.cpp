#include "terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;
static bool g_watching = false;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    if (g_watching) return;
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGWINCH, &sa, &g_old_sa);
    g_watching = true;
}

void unwatch_terminal_resize() {
    if (!g_watching) return;
    sigaction(SIGWINCH, &g_old_sa, nullptr);
    g_watching = false;
}

bool consume_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

} // namespace platform
