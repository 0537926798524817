#include "repl.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <cstdio>
#include <filesystem>
#include <cstdlib>
#include <iostream>
#include <readline/readline.h>
#include <readline/history.h>

Repl* Repl::active_ = nullptr;

static std::string render(const TranscriptRecord& record, const std::string& text) {
    switch (record.type) {
        case LineType::INPUT:  return "";
        case LineType::ERROR:  return theme::fail(text);
        case LineType::SYSTEM: return theme::dim("    " + text) + "\n";
        case LineType::OUTPUT: break;
    }
    if (record.open) return text;
    return text + "\n";
}

void print_transcript(const Transcript& transcript) {
    for (const auto& record : transcript.records()) {
        std::string out = render(record, record.text);
        if (record.open && !out.empty() && out.back() != '\n') out += '\n';
        std::cout << out;
    }
    std::cout << std::flush;
}

Repl::Repl(Terminal& term) : term_(term) {
    term_.transcript().set_listener(
        [this](size_t, const TranscriptRecord& record, const std::string& added) {
            print_record(record, added);
        });
    term_.transcript().set_clear_listener([this] {
        mid_line_ = false;
        print_above(theme::banner(SEACMD_VERSION));
    });
}

Repl::~Repl() {
    term_.transcript().set_listener(nullptr);
    term_.transcript().set_clear_listener(nullptr);
}

void Repl::on_line(char* line) {
    if (!active_) return;
    if (!line) {
        active_->eof_ = true;
        rl_callback_handler_remove();
        return;
    }
    std::string text = line;
    free(line);
    active_->handle_line(text);
}

void Repl::handle_line(const std::string& line) {
    if (!term_.shell_mode() && !line.empty()) {
        add_history(redact_secrets(line).c_str());
    }
    mid_line_ = false;
    term_.submit_line(line);
}

void Repl::print_record(const TranscriptRecord& record, const std::string& added) {
    std::string out;
    bool fragment = record.open;
    if (mid_line_ && !fragment) out += "\n";
    out += render(record, added);
    if (out.empty()) return;
    if (fragment) mid_line_ = out.back() != '\n';
    else mid_line_ = false;
    print_above(out);
}

void Repl::print_above(const std::string& text) {
    // Readline owns the current line; stash it, print, then redraw.
    if (RL_ISSTATE(RL_STATE_CALLBACK) && rl_line_buffer) {
        int saved_point = rl_point;
        char* saved_line = rl_copy_text(0, rl_end);
        rl_save_prompt();
        rl_replace_line("", 0);
        rl_redisplay();

        std::cout << text << std::flush;

        rl_restore_prompt();
        rl_replace_line(saved_line, 0);
        rl_point = saved_point;
        rl_forced_update_display();
        free(saved_line);
    } else {
        std::cout << text << std::flush;
    }
}

void Repl::refresh_prompt() {
    std::string prompt = term_.prompt_string();
    if (prompt == prompt_) return;
    prompt_ = prompt;
    rl_set_prompt(prompt_.c_str());
    rl_forced_update_display();
}

int Repl::run() {
    std::cout << theme::banner(SEACMD_VERSION);
    const auto& local_dir = term_.config().transfer().local_dir;
    std::cout << theme::kv("Config", get_config_path().string());
    std::cout << theme::kv("Local dir", local_dir.empty()
                                            ? std::filesystem::current_path().string()
                                            : local_dir);
    if (term_.config().log().enabled) std::cout << theme::kv("Log", seacmd_log_path());
    std::cout << "\n" << std::flush;

    active_ = this;
    platform::watch_terminal_resize();
    prompt_ = term_.prompt_string();
    rl_callback_handler_install(prompt_.c_str(), &Repl::on_line);

    while (!eof_ && !term_.quit_requested()) {
        if (platform::poll_stdin(REPL_POLL_MS)) {
            rl_callback_read_char();
        }
        term_.pump();
        if (platform::consume_resize()) {
            rl_resize_terminal();
            term_.window_resized(platform::term_width(), platform::term_height());
        }
        if (!eof_) refresh_prompt();
    }

    if (!eof_) rl_callback_handler_remove();
    platform::unwatch_terminal_resize();
    active_ = nullptr;

    std::cout << "\n" << theme::dim("Disconnecting...") << "\n";
    term_.session().disconnect();
    return 0;
}
