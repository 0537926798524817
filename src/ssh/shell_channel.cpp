#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <chrono>

Libssh2ShellChannel::Libssh2ShellChannel(LIBSSH2_CHANNEL* ch,
                                         std::shared_ptr<std::mutex> io_mutex, socket_t sock)
    : ch_(ch), io_mutex_(std::move(io_mutex)), sock_(sock) {}

Libssh2ShellChannel::~Libssh2ShellChannel() {
    close();
}

void Libssh2ShellChannel::close() {
    if (!ch_ || !io_mutex_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

int Libssh2ShellChannel::read(char* buf, size_t len) {
    if (!ch_) return CLOSED;

    std::lock_guard<std::mutex> lock(*io_mutex_);

    // Alternate between the two streams so a chatty stdout cannot starve
    // stderr; whichever has data first wins this round.
    for (int attempt = 0; attempt < 2; attempt++) {
        ssize_t n = read_stderr_next_
            ? libssh2_channel_read_stderr(ch_, buf, len)
            : libssh2_channel_read(ch_, buf, len);
        read_stderr_next_ = !read_stderr_next_;
        if (n > 0) return static_cast<int>(n);
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) return FAILED;
    }

    if (libssh2_channel_eof(ch_)) return CLOSED;
    return WOULD_BLOCK;
}

bool Libssh2ShellChannel::write(const std::string& data) {
    if (!ch_) return false;

    size_t written = 0;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (written < data.size()) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_write(ch_, data.c_str() + written, data.size() - written);
        }
        if (n == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            platform::sleep_ms(EAGAIN_SLEEP_MS);
            continue;
        }
        if (n < 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

bool Libssh2ShellChannel::resize(int cols, int rows) {
    if (!ch_) return false;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_request_pty_size(ch_, cols, rows);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc == 0;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

bool Libssh2ShellChannel::is_open() {
    if (!ch_) return false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_eof(ch_) == 0;
}

void Libssh2ShellChannel::wait_readable(int timeout_ms) {
    // Poll socket without holding io_mutex_
    platform::poll_socket(sock_, POLLIN, timeout_ms);
}
