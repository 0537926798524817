#include "../terminal.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static std::string already_connected(Terminal& term) {
    return "Already connected to: " + term.session().connection_string() +
           "\nUse 'ssh-exec <command>' to run commands."
           "\nUse 'ssh-shell' for interactive shell."
           "\nUse 'exit' to disconnect.";
}

static CommandResult do_ssh(Terminal& term, const CommandLine& cmd) {
    if (term.session().is_connected()) {
        return CommandResult::ok(already_connected(term));
    }

    auto target = parse_ssh_target(cmd.args, term.config().defaults().port);
    if (target.is_err()) return CommandResult::fail(target.kind, target.error);

    term.pending().stage(target.value);
    return CommandResult::ok("Ready to connect to " + target.value.to_string() +
                             "\nEnter password with: ssh-login <password>"
                             "\nor use a key with: ssh-login-key <keyfile> [passphrase]");
}

// The staged target, or an error event explaining why there is none.
static std::optional<SshTarget> take_pending(Terminal& term, const std::string& name,
                                             const Dispatcher::Emit& emit) {
    if (term.session().is_connected()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION, already_connected(term)));
        return std::nullopt;
    }
    auto target = term.pending().get();
    if (!target) {
        std::string why = term.pending().expired()
            ? name + ": pending connection expired. Use 'ssh user@host' again."
            : name + ": no pending connection. Use 'ssh user@host' first.";
        emit(OutputEvent::error(ErrorKind::PRECONDITION, why));
    }
    return target;
}

static void report_connect(Terminal& term, const Result<std::string>& r,
                           const Dispatcher::Emit& emit) {
    if (r.is_ok()) {
        term.pending().clear();
        emit(OutputEvent::out(r.value));
        return;
    }
    emit(OutputEvent::error(r.kind, r.kind == ErrorKind::AUTH
                                        ? r.error + "\nTry again with: ssh-login <password>"
                                        : r.error));
}

static void do_ssh_login(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.rest.empty()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION,
                                "ssh-login: missing password\nUsage: ssh-login <password>"));
        return;
    }
    auto target = take_pending(term, "ssh-login", emit);
    if (!target) return;

    std::string password = cmd.rest;
    auto status = [&emit](const std::string& msg) { emit(OutputEvent::out(msg)); };
    auto r = term.session().connect(target->host, target->port, target->username,
                                    password, status);
    wipe(password);
    report_connect(term, r, emit);
}

static void do_ssh_login_key(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    std::string key = cmd.args.empty() ? term.config().defaults().key_path : cmd.args[0];
    if (key.empty()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION,
            "ssh-login-key: missing key file\nUsage: ssh-login-key <keyfile> [passphrase]"));
        return;
    }
    auto target = take_pending(term, "ssh-login-key", emit);
    if (!target) return;

    std::string passphrase = cmd.args.size() > 1 ? cmd.args[1] : "";
    auto status = [&emit](const std::string& msg) { emit(OutputEvent::out(msg)); };
    auto r = term.session().connect_with_key(target->host, target->port, target->username,
                                             key, passphrase, status);
    wipe(passphrase);
    report_connect(term, r, emit);
}

static void do_ssh_exec(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.rest.empty()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION,
                                "ssh-exec: missing command\nUsage: ssh-exec <command>"));
        return;
    }
    if (term.session().is_connected()) emit(OutputEvent::out("$ " + cmd.rest));

    auto result = term.session().execute_command(cmd.rest);
    if (result.is_error) {
        emit(OutputEvent::error(result.kind, result.output));
    } else {
        emit(OutputEvent::out(result.output));
    }
}

static void do_ssh_run(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.rest.empty()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION,
                                "ssh-run: missing command\nUsage: ssh-run <command>"));
        return;
    }
    if (term.session().is_connected()) emit(OutputEvent::out("$ " + cmd.rest));

    size_t streamed = 0;
    auto result = term.session().execute_command_streaming(cmd.rest,
        [&emit, &streamed](const std::string& chunk) {
            streamed += chunk.size();
            emit(OutputEvent::chunk(chunk));
        });

    // Whatever the result adds beyond the streamed bytes: exit status,
    // a timeout notice, or the empty-output marker.
    std::string tail = result.output.size() > streamed ? result.output.substr(streamed) : "";
    trim(tail);
    if (result.is_error) {
        emit(OutputEvent::error(result.kind, tail.empty() ? result.output : tail));
    } else if (!tail.empty()) {
        emit(OutputEvent::out(tail));
    }
}

static CommandResult do_ssh_info(Terminal& term, const CommandLine& cmd) {
    auto& session = term.session();
    std::string out;
    if (session.is_connected()) {
        out += theme::kv("Connection", session.connection_string());
        out += theme::kv("State", session.state_name());
        out += theme::kv("Shell", session.shell().is_active() ? "active" : "inactive");
        out += theme::kv("SFTP", session.sftp().is_open() ? "open" : "closed");
    } else {
        out += "Not connected to any SSH server.\n";
        out += theme::kv("State", session.state_name());
        if (!session.last_error().empty()) out += theme::kv("Last error", session.last_error());
    }
    if (auto target = term.pending().get()) {
        out += theme::kv("Pending", target->to_string());
    }
    if (!out.empty() && out.back() == '\n') out.pop_back();
    return CommandResult::ok(out);
}

static CommandResult do_ssh_fingerprint(Terminal& term, const CommandLine& cmd) {
    std::string fp = term.session().fingerprint();
    if (fp.empty()) return CommandResult::ok("Not connected to any SSH server.");
    return CommandResult::ok("Server fingerprint: " + fp);
}

// Runs on the worker so the caller never waits for a transport close.
static void do_exit(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    term.pending().clear();
    bool was_connected = term.session().is_connected();
    term.session().disconnect();
    if (was_connected) emit(OutputEvent::out("SSH connection closed."));
}

void register_connection_commands(Terminal& term) {
    auto& d = term.dispatcher();
    d.add_command("ssh", [&term](const CommandLine& c) { return do_ssh(term, c); },
                  "Stage a connection: ssh user@host [-p port]", "Session", true);
    d.add_async_command("ssh-login",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ssh_login(term, c, e); },
                        "Log in to the staged host with a password", "Session");
    d.add_async_command("ssh-login-key",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ssh_login_key(term, c, e); },
                        "Log in with a private key: <keyfile> [passphrase]", "Session");
    d.add_command("ssh-info", [&term](const CommandLine& c) { return do_ssh_info(term, c); },
                  "Show connection details", "Session");
    d.add_command("ssh-fingerprint", [&term](const CommandLine& c) { return do_ssh_fingerprint(term, c); },
                  "Show the server host key fingerprint", "Session");
    d.add_async_command("exit",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_exit(term, c, e); },
                        "Disconnect the SSH session", "Session");
    d.add_async_command("ssh-exec",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ssh_exec(term, c, e); },
                        "Run a remote command and show its output", "Remote");
    d.add_async_command("ssh-run",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ssh_run(term, c, e); },
                        "Run a remote command, streaming output", "Remote");
}
