#include "dispatcher.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

static const char* BUSY_MSG = "another command is still executing";

Dispatcher::Dispatcher(Worker& worker) : worker_(worker) {}

void Dispatcher::note_group(const std::string& group) {
    if (std::find(groups_.begin(), groups_.end(), group) == groups_.end())
        groups_.push_back(group);
}

void Dispatcher::add_command(const std::string& name, SyncHandler handler,
                             const std::string& help, const std::string& group,
                             bool exclusive) {
    async_commands_.erase(name);
    commands_[name] = {std::move(handler), help, group, exclusive};
    note_group(group);
}

void Dispatcher::add_async_command(const std::string& name, AsyncHandler handler,
                                   const std::string& help, const std::string& group) {
    commands_.erase(name);
    async_commands_[name] = {std::move(handler), help, group};
    note_group(group);
}

bool Dispatcher::has_command(const std::string& name) const {
    return commands_.count(name) || async_commands_.count(name);
}

bool Dispatcher::is_async(const std::string& name) const {
    return async_commands_.count(name) > 0;
}

CommandResult Dispatcher::execute(const std::string& line) {
    auto cmd = parse_command_line(line);
    if (cmd.empty()) return CommandResult::ok("");

    auto it = commands_.find(cmd.name);
    if (it == commands_.end()) {
        return CommandResult::fail(ErrorKind::PRECONDITION,
            "command not found: " + cmd.name + ". Type 'help' for available commands.");
    }
    if (it->second.exclusive && busy()) {
        return CommandResult::fail(ErrorKind::BUSY, BUSY_MSG);
    }

    try {
        return it->second.handler(cmd);
    } catch (const std::exception& e) {
        seacmd_log(fmt::format("dispatcher: '{}' threw: {}", cmd.name, e.what()));
        return CommandResult::fail(ErrorKind::REMOTE, cmd.name + ": " + e.what());
    }
}

bool Dispatcher::execute_async(const std::string& line, OutputHandler on_output,
                               CompletionHandler on_complete) {
    auto cmd = parse_command_line(line);
    auto it = async_commands_.find(cmd.name);
    if (it == async_commands_.end()) return false;

    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        if (on_output) on_output(OutputEvent::error(ErrorKind::BUSY, BUSY_MSG));
        if (on_complete) on_complete();
        return true;
    }

    AsyncHandler handler = it->second.handler;
    auto job = [this, cmd, handler, on_output, on_complete] {
        Emit emit = [&on_output](const OutputEvent& ev) {
            if (on_output) on_output(ev);
        };
        try {
            handler(cmd, emit);
        } catch (const std::exception& e) {
            seacmd_log(fmt::format("dispatcher: '{}' threw: {}", cmd.name, e.what()));
            emit(OutputEvent::error(ErrorKind::REMOTE, cmd.name + ": " + e.what()));
        }
        in_flight_ = false;
        if (on_complete) on_complete();
    };

    try {
        worker_.post(std::move(job));
    } catch (const std::runtime_error& e) {
        in_flight_ = false;
        if (on_output) on_output(OutputEvent::error(ErrorKind::PRECONDITION, e.what()));
        if (on_complete) on_complete();
    }
    return true;
}

std::optional<CommandTask> Dispatcher::submit(const std::string& line) {
    auto cmd = parse_command_line(line);
    if (!is_async(cmd.name)) return std::nullopt;

    CommandTask task;
    execute_async(line,
                  [task](const OutputEvent& ev) mutable { task.push(ev); },
                  [task]() mutable { task.complete(); });
    return task;
}

std::string Dispatcher::help_text() const {
    std::string out;
    for (const auto& group : groups_) {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto& [name, entry] : commands_)
            if (entry.group == group) rows.emplace_back(name, entry.help);
        for (const auto& [name, entry] : async_commands_)
            if (entry.group == group) rows.emplace_back(name, entry.help);
        if (rows.empty()) continue;
        std::sort(rows.begin(), rows.end());

        out += "\n" + theme::color::BROWN + theme::color::BOLD + "  " + group +
               theme::color::RESET + "\n";
        for (const auto& [name, help] : rows) {
            out += theme::color::BLUE + fmt::format("    {:<16}", name) + theme::color::RESET +
                   theme::color::DIM + help + theme::color::RESET + "\n";
        }
    }
    return out;
}
