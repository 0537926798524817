#include "../terminal.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>

static CommandResult do_echo(Terminal& term, const CommandLine& cmd) {
    return CommandResult::ok(cmd.rest);
}

static CommandResult do_date(Terminal& term, const CommandLine& cmd) {
    std::time_t now = std::time(nullptr);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Z %Y", std::localtime(&now));
    return CommandResult::ok(buf);
}

static CommandResult do_pwd(Terminal& term, const CommandLine& cmd) {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) return CommandResult::fail(ErrorKind::LOCAL_IO, "pwd: " + ec.message());
    return CommandResult::ok(cwd.string());
}

static CommandResult do_help(Terminal& term, const CommandLine& cmd) {
    return CommandResult::ok(term.dispatcher().help_text());
}

static CommandResult do_clear(Terminal& term, const CommandLine& cmd) {
    return CommandResult::ok(CLEAR_MARKER);
}

static CommandResult do_quit(Terminal& term, const CommandLine& cmd) {
    term.request_quit();
    return CommandResult::ok("");
}

// TCP reachability probe: connect, then close.
static void do_ping(Terminal& term, const CommandLine& cmd, const Dispatcher::Emit& emit) {
    if (cmd.args.empty()) {
        emit(OutputEvent::error(ErrorKind::PRECONDITION, "ping: usage: ping <host> [port]"));
        return;
    }
    const std::string& host = cmd.args[0];
    int port = 80;
    if (cmd.args.size() > 1) {
        port = parse_port(cmd.args[1]);
        if (port < 0) {
            emit(OutputEvent::error(ErrorKind::PRECONDITION,
                                    "ping: invalid port '" + cmd.args[1] + "'"));
            return;
        }
    }

    emit(OutputEvent::out(fmt::format("PING {}:{}...", host, port)));

    auto start = std::chrono::steady_clock::now();
    auto sock = platform::connect_tcp(host, port, PING_TIMEOUT_MS);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (sock.is_err()) {
        emit(OutputEvent::out(fmt::format("Host {} is not reachable ({})", host, sock.error)));
        return;
    }
    platform::close_socket(sock.value);
    emit(OutputEvent::out(fmt::format("Host {} is reachable on port {} ({} ms)", host, port, ms)));
}

void register_builtin_commands(Terminal& term) {
    auto& d = term.dispatcher();
    d.add_command("echo", [&term](const CommandLine& c) { return do_echo(term, c); },
                  "Print the arguments");
    d.add_command("date", [&term](const CommandLine& c) { return do_date(term, c); },
                  "Show the local date and time");
    d.add_command("pwd", [&term](const CommandLine& c) { return do_pwd(term, c); },
                  "Show the working directory");
    d.add_command("help", [&term](const CommandLine& c) { return do_help(term, c); },
                  "Show this help message");
    d.add_command("clear", [&term](const CommandLine& c) { return do_clear(term, c); },
                  "Clear the screen");
    d.add_command("quit", [&term](const CommandLine& c) { return do_quit(term, c); },
                  "Leave seacmd");
    d.add_async_command("ping",
                        [&term](const CommandLine& c, const Dispatcher::Emit& e) { do_ping(term, c, e); },
                        "TCP reachability: ping <host> [port]", "Network");
}
