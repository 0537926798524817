#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <core/config.hpp>
#include <core/worker.hpp>
#include <ssh/session.hpp>
#include "dispatcher.hpp"
#include "pending_connection.hpp"
#include "transcript.hpp"

// Work handed from background threads to the caller thread.
class EventQueue {
public:
    using Event = std::function<void()>;

    void push(Event event);
    std::deque<Event> take_all();

    // Wait until something is queued or the timeout passes.
    bool wait(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
};

// Everything between the input line and the session: pending target,
// shell-input-forwarding mode, the in-flight count and the transcript.
// Background output is queued and applied only by pump() on the thread
// that owns the Terminal.
class Terminal {
public:
    Terminal(const Config& config, Session& session);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Handle one line of user input.
    void submit_line(const std::string& line);

    // Apply queued background events. Returns how many ran.
    size_t pump();

    // Pump until no command is executing. False on timeout.
    bool run_until_idle(std::chrono::milliseconds timeout);

    // Wait for background events without applying them.
    void wait_for_events(std::chrono::milliseconds timeout) { queue_.wait(timeout); }

    bool executing() const { return in_flight_ > 0; }
    bool shell_mode() const { return shell_mode_; }
    bool quit_requested() const { return quit_requested_; }
    void request_quit() { quit_requested_ = true; }

    // Whether the most recent command reported an error.
    bool last_failed() const { return last_failed_; }

    void enter_shell_mode();
    void leave_shell_mode();
    void window_resized(int cols, int rows);

    // Thread-safe; `event` runs later inside pump().
    void post(EventQueue::Event event);

    // Readline prompt with non-printing sequences wrapped in \001 \002.
    std::string prompt_string() const;

    const Config& config() const { return config_; }
    Session& session() { return session_; }
    PendingConnection& pending() { return pending_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    Transcript& transcript() { return transcript_; }

private:
    Config config_;
    Session& session_;
    PendingConnection pending_;
    Transcript transcript_;
    EventQueue queue_;
    int in_flight_ = 0;
    bool shell_mode_ = false;
    bool quit_requested_ = false;
    bool last_failed_ = false;

    Dispatcher dispatcher_;
    // Declared last: destroyed first, so queued tasks finish while the
    // rest of the terminal is still alive.
    Worker worker_;

    void register_all_commands();
    void handle_shell_input(const std::string& line);
    void apply(const OutputEvent& event);
    void apply(const CommandResult& result);
};

// Command groups, registered by the Terminal.
void register_builtin_commands(Terminal& term);
void register_connection_commands(Terminal& term);
void register_shell_commands(Terminal& term);
void register_sftp_commands(Terminal& term);
