#include "command_line.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

CommandLine parse_command_line(const std::string& line) {
    CommandLine cmd;
    std::string text = line;
    trim(text);
    if (text.empty()) return cmd;

    auto words = split_words(text);
    cmd.name = to_lower(words.front());
    cmd.args.assign(words.begin() + 1, words.end());

    auto space = text.find(' ');
    if (space != std::string::npos) {
        auto start = text.find_first_not_of(' ', space);
        if (start != std::string::npos) cmd.rest = text.substr(start);
    }
    return cmd;
}

std::string SshTarget::to_string() const {
    return fmt::format("{}@{}:{}", username, host, port);
}

static const char* SSH_USAGE = "ssh: invalid syntax. Usage: ssh user@host [-p port]";

Result<SshTarget> parse_ssh_target(const std::vector<std::string>& args, int default_port) {
    SshTarget target;
    target.port = default_port;
    bool have_dest = false;

    for (size_t i = 0; i < args.size(); i++) {
        const auto& arg = args[i];
        if (arg == "-p") {
            if (i + 1 >= args.size()) {
                return Result<SshTarget>::Err(ErrorKind::PRECONDITION, "ssh: option -p requires a port");
            }
            int port = parse_port(args[++i]);
            if (port < 0) {
                return Result<SshTarget>::Err(ErrorKind::PRECONDITION,
                                              "ssh: invalid port '" + args[i] + "'");
            }
            target.port = port;
            continue;
        }
        if (have_dest) {
            return Result<SshTarget>::Err(ErrorKind::PRECONDITION, SSH_USAGE);
        }

        auto at = arg.find('@');
        if (at == std::string::npos || at == 0 || at + 1 >= arg.size() ||
            arg.find('@', at + 1) != std::string::npos) {
            return Result<SshTarget>::Err(ErrorKind::PRECONDITION, SSH_USAGE);
        }
        target.username = arg.substr(0, at);
        target.host = arg.substr(at + 1);
        have_dest = true;
    }

    if (!have_dest) return Result<SshTarget>::Err(ErrorKind::PRECONDITION, SSH_USAGE);
    return Result<SshTarget>::Ok(target);
}

std::string redact_secrets(const std::string& line) {
    auto cmd = parse_command_line(line);
    if (cmd.name == "ssh-login" && !cmd.args.empty()) {
        return "ssh-login ********";
    }
    if (cmd.name == "ssh-login-key" && cmd.args.size() > 1) {
        return "ssh-login-key " + cmd.args[0] + " ********";
    }
    return line;
}
