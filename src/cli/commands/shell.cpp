#include "../terminal.hpp"

static void do_ssh_shell(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    auto& shell = term.session().shell();
    if (shell.is_active()) {
        term.post([&term] { term.enter_shell_mode(); });
        emit(OutputEvent::out("Interactive shell already active."));
        return;
    }
    if (!term.session().is_connected()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION,
            "ssh: not connected. Use 'ssh user@host' and 'ssh-login <password>' first."));
        return;
    }

    emit(OutputEvent::out("Starting interactive shell..."));
    if (!shell.start()) {
        emit(OutputEvent::error(ErrorKind::REMOTE, "Failed to start interactive shell."));
        return;
    }
    term.post([&term] { term.enter_shell_mode(); });
    emit(OutputEvent::out("Interactive shell started. Type commands directly.\n"
                          "Use 'ssh-shell-end' or 'exit' to leave shell mode."));
}

static CommandResult do_ssh_shell_end(Terminal& term, const CommandLine& cmd) {
    term.session().shell().close();
    term.leave_shell_mode();
    return CommandResult::ok("Interactive shell ended.");
}

void register_shell_commands(Terminal& term) {
    auto& d = term.dispatcher();
    d.add_async_command("ssh-shell",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ssh_shell(term, c, e); },
                        "Start an interactive remote shell", "Shell");
    d.add_command("ssh-shell-end", [&term](const CommandLine& c) { return do_ssh_shell_end(term, c); },
                  "Close the interactive shell", "Shell", true);
}
