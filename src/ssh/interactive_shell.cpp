#include "interactive_shell.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>

InteractiveShell::InteractiveShell(Session& session) : session_(session) {}

InteractiveShell::~InteractiveShell() {
    close();
}

void InteractiveShell::set_handlers(Handler on_output, Handler on_error) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_output_ = std::move(on_output);
    on_error_ = std::move(on_error);
}

bool InteractiveShell::start() {
    if (is_active()) return true;
    // A shell the remote already closed still holds its channel.
    close();

    auto r = session_.open_shell();
    if (r.is_err()) {
        emit_error("Failed to start interactive shell: " + r.error);
        return false;
    }
    return true;
}

void InteractiveShell::attach(std::unique_ptr<ShellChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
    stop_ = false;
    running_ = true;
    reader_ = std::thread(&InteractiveShell::reader_loop, this, channel_.get());
    seacmd_log("shell: started");
}

void InteractiveShell::reader_loop(ShellChannel* channel) {
    char buf[SSH_READ_BUF_SIZE];
    while (!stop_) {
        int n = channel->read(buf, sizeof(buf));
        if (n > 0) {
            emit_output(std::string(buf, static_cast<size_t>(n)));
            continue;
        }
        if (n == ShellChannel::CLOSED) {
            running_ = false;
            seacmd_log("shell: closed by remote host");
            emit_error("Shell session closed by remote host");
            return;
        }
        if (n == ShellChannel::FAILED) {
            running_ = false;
            seacmd_log("shell: read error");
            emit_error("Shell read error: channel failed");
            return;
        }
        channel->wait_readable(SHELL_POLL_MS);
    }
}

void InteractiveShell::write(const std::string& data) {
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel_ || !running_) return;
        ok = channel_->write(data);
    }
    if (!ok) emit_error("Failed to send input to shell");
}

void InteractiveShell::resize(int cols, int rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_ || !running_) return;
    channel_->resize(cols, rows);
}

void InteractiveShell::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
    if (reader_.joinable()) reader_.join();
    if (channel_) {
        channel_->close();
        channel_.reset();
        seacmd_log("shell: closed");
    }
    running_ = false;
}

bool InteractiveShell::is_active() {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ && running_ && channel_->is_open();
}

void InteractiveShell::emit_output(const std::string& text) {
    Handler h;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        h = on_output_;
    }
    if (h) h(text);
}

void InteractiveShell::emit_error(const std::string& text) {
    Handler h;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        h = on_error_;
    }
    if (h) h(text);
}
