#include "command_task.hpp"

CommandTask::CommandTask() : state_(std::make_shared<State>()) {}

bool CommandTask::next(OutputEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this] {
        return !state_->events.empty() || state_->finished || state_->cancelled;
    });
    if (state_->events.empty()) return false;
    event = std::move(state_->events.front());
    state_->events.pop_front();
    return true;
}

bool CommandTask::finished() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->finished;
}

void CommandTask::wait() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->finished; });
}

bool CommandTask::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->finished; });
}

void CommandTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
        state_->events.clear();
    }
    state_->cv.notify_all();
}

bool CommandTask::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CommandTask::push(OutputEvent event) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled || state_->finished) return;
        state_->events.push_back(std::move(event));
    }
    state_->cv.notify_all();
}

void CommandTask::complete() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->finished = true;
    }
    state_->cv.notify_all();
}
