#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// One input line split into a command and its arguments. No quoting:
// arguments are runs of non-space characters.
struct CommandLine {
    std::string name;                 // lowercased
    std::vector<std::string> args;    // original case
    std::string rest;                 // raw text after the command token

    bool empty() const { return name.empty(); }
};

CommandLine parse_command_line(const std::string& line);

struct SshTarget {
    std::string username;
    std::string host;
    int port = 22;

    std::string to_string() const;
};

// "user@host [-p port]" from the arguments of an 'ssh' command.
Result<SshTarget> parse_ssh_target(const std::vector<std::string>& args, int default_port);

// The line with any secret arguments masked, for the transcript and history.
std::string redact_secrets(const std::string& line);
