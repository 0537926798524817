#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for a PTY shell channel. Owns the channel and closes+frees
// it on destruction. All libssh2 calls are protected by brief io_mutex_
// holds so the reader thread and writers can interleave.
class Libssh2ShellChannel : public ShellChannel {
public:
    Libssh2ShellChannel(LIBSSH2_CHANNEL* ch,
                        std::shared_ptr<std::mutex> io_mutex, socket_t sock);
    ~Libssh2ShellChannel() override;

    int read(char* buf, size_t len) override;
    bool write(const std::string& data) override;
    bool resize(int cols, int rows) override;
    bool is_open() override;
    void wait_readable(int timeout_ms) override;
    void close() override;

    // Non-copyable
    Libssh2ShellChannel(const Libssh2ShellChannel&) = delete;
    Libssh2ShellChannel& operator=(const Libssh2ShellChannel&) = delete;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    socket_t sock_;
    bool read_stderr_next_ = false;
};
