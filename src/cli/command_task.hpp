#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// One piece of output from a running command.
struct OutputEvent {
    std::string text;
    bool is_error = false;
    ErrorKind kind = ErrorKind::NONE;
    bool fragment = false;     // unframed stream data; joins the open record

    static OutputEvent out(std::string text) {
        return {std::move(text), false, ErrorKind::NONE, false};
    }
    static OutputEvent error(ErrorKind kind, std::string text) {
        return {std::move(text), true, kind, false};
    }
    static OutputEvent chunk(std::string text) {
        return {std::move(text), false, ErrorKind::NONE, true};
    }
};

// Handle on an asynchronous command: a thread-safe event channel plus a
// completion signal. Copies share the same state.
class CommandTask {
public:
    CommandTask();

    // Pop the next event. Waits up to `timeout`; false when nothing
    // arrived or the task finished with the channel drained. cancel()
    // wakes a waiting caller at once.
    bool next(OutputEvent& event, std::chrono::milliseconds timeout);

    // Completion was signalled (events may still be queued).
    bool finished() const;

    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Drop queued events and ignore any that follow. The work itself runs
    // to its own timeout.
    void cancel();
    bool cancelled() const;

    // Producer side
    void push(OutputEvent event);
    void complete();

private:
    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::deque<OutputEvent> events;
        bool finished = false;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};
