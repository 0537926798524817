#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "transport.hpp"

class Session;

// Interactive PTY shell on the session. A reader thread forwards every
// inbound fragment (stdout and stderr, unframed) to the output handler and
// failures to the error handler. Handlers run on the reader thread.
//
// Usage:
//     shell.set_handlers(on_output, on_error);
//     if (shell.start()) shell.write("ls\n");
//     ...
//     shell.close();
class InteractiveShell {
public:
    using Handler = std::function<void(const std::string&)>;

    explicit InteractiveShell(Session& session);
    ~InteractiveShell();

    InteractiveShell(const InteractiveShell&) = delete;
    InteractiveShell& operator=(const InteractiveShell&) = delete;

    void set_handlers(Handler on_output, Handler on_error);

    // Open a PTY channel and start the reader. Returns false (after telling
    // the error handler) when the session is unusable or the channel fails.
    bool start();

    // Fire-and-forget; no-op while inactive.
    void write(const std::string& data);
    void resize(int cols, int rows);

    // Stop the reader and close the channel. Idempotent.
    void close();

    bool is_active();

private:
    friend class Session;

    Session& session_;
    std::mutex mutex_;              // channel_, reader_
    std::mutex handler_mutex_;
    std::unique_ptr<ShellChannel> channel_;
    std::thread reader_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};
    Handler on_output_;
    Handler on_error_;

    // Called by Session with op_mutex_ held.
    void attach(std::unique_ptr<ShellChannel> channel);

    void reader_loop(ShellChannel* channel);
    void emit_output(const std::string& text);
    void emit_error(const std::string& text);
};
