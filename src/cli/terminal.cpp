#include "terminal.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <map>

// ── EventQueue ─────────────────────────────────────────────

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

std::deque<EventQueue::Event> EventQueue::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<Event> out;
    out.swap(events_);
    return out;
}

bool EventQueue::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
}

// ── Terminal ───────────────────────────────────────────────

Terminal::Terminal(const Config& config, Session& session)
    : config_(config), session_(session),
      pending_(std::chrono::seconds(config.timeouts().pending_login)),
      dispatcher_(worker_) {
    register_all_commands();

    session_.shell().set_handlers(
        [this](const std::string& text) {
            post([this, text] { transcript_.append_fragment(LineType::OUTPUT, text); });
        },
        [this](const std::string& text) {
            post([this, text] {
                // Start failures are reported by the command itself.
                if (!shell_mode_) return;
                transcript_.append(LineType::ERROR, text);
                if (!session_.shell().is_active()) leave_shell_mode();
            });
        });
}

Terminal::~Terminal() {
    session_.shell().close();
    session_.shell().set_handlers(nullptr, nullptr);
}

void Terminal::register_all_commands() {
    register_builtin_commands(*this);
    register_connection_commands(*this);
    register_shell_commands(*this);
    register_sftp_commands(*this);
}

void Terminal::post(EventQueue::Event event) {
    queue_.push(std::move(event));
}

size_t Terminal::pump() {
    auto events = queue_.take_all();
    for (auto& ev : events) ev();
    return events.size();
}

bool Terminal::run_until_idle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    pump();
    while (executing()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        queue_.wait(std::min<std::chrono::milliseconds>(
            std::chrono::milliseconds(REPL_POLL_MS),
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
        pump();
    }
    return true;
}

void Terminal::submit_line(const std::string& line) {
    if (shell_mode_) {
        handle_shell_input(line);
        return;
    }

    std::string text = line;
    trim(text);
    if (text.empty()) return;

    last_failed_ = false;
    transcript_.append(LineType::INPUT, redact_secrets(text));

    auto cmd = parse_command_line(text);
    if (dispatcher_.is_async(cmd.name)) {
        in_flight_++;
        dispatcher_.execute_async(
            text,
            [this](const OutputEvent& ev) { post([this, ev] { apply(ev); }); },
            [this] { post([this] { in_flight_--; transcript_.close_open(); }); });
        return;
    }

    apply(dispatcher_.execute(text));
}

void Terminal::apply(const OutputEvent& event) {
    if (event.is_error) last_failed_ = true;
    if (event.fragment) {
        transcript_.append_fragment(LineType::OUTPUT, event.text);
    } else if (!event.text.empty()) {
        transcript_.append(event.is_error ? LineType::ERROR : LineType::OUTPUT, event.text);
    }
}

void Terminal::apply(const CommandResult& result) {
    if (result.is_error) last_failed_ = true;
    if (result.output == CLEAR_MARKER) {
        transcript_.clear();
    } else if (!result.output.empty()) {
        transcript_.append(result.is_error ? LineType::ERROR : LineType::OUTPUT, result.output);
    }
}

// ── Shell-input-forwarding mode ────────────────────────────

void Terminal::handle_shell_input(const std::string& line) {
    static const std::map<std::string, std::string> control_tokens = {
        {"ctrl-c", "\x03"},
        {"ctrl-d", "\x04"},
        {"ctrl-z", "\x1a"},
        {"tab",    "\t"},
    };

    std::string key = line;
    trim(key);
    key = to_lower(key);

    if (key == "exit" || key == "logout" || key == "ssh-shell-end") {
        session_.shell().close();
        leave_shell_mode();
        transcript_.append(LineType::SYSTEM, "Interactive shell ended.");
        return;
    }

    auto it = control_tokens.find(key);
    if (it != control_tokens.end()) {
        session_.shell().write(it->second);
        return;
    }
    session_.shell().write(line + "\n");
}

void Terminal::enter_shell_mode() {
    if (!session_.shell().is_active()) return;
    shell_mode_ = true;
    seacmd_log("terminal: shell mode on");
}

void Terminal::leave_shell_mode() {
    if (!shell_mode_) return;
    shell_mode_ = false;
    transcript_.close_open();
    seacmd_log("terminal: shell mode off");
}

void Terminal::window_resized(int cols, int rows) {
    if (shell_mode_) session_.shell().resize(cols, rows);
}

std::string Terminal::prompt_string() const {
    // In shell mode the remote prints its own prompt.
    if (shell_mode_) return "";

    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "seacmd" + rl_esc(theme::color::RESET);
    if (session_.is_connected()) {
        prompt += ":" + rl_esc(theme::color::GREEN) + session_.connection_string()
                + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
