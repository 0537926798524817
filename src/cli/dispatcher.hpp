#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/worker.hpp>
#include "command_line.hpp"
#include "command_task.hpp"

// Routes input lines to registered handlers. Synchronous handlers return a
// CommandResult; asynchronous ones run on the worker and report through an
// event callback. At most one asynchronous command is in flight.
class Dispatcher {
public:
    using Emit = std::function<void(const OutputEvent&)>;
    using SyncHandler = std::function<CommandResult(const CommandLine&)>;
    using AsyncHandler = std::function<void(const CommandLine&, const Emit&)>;
    using OutputHandler = std::function<void(const OutputEvent&)>;
    using CompletionHandler = std::function<void()>;

    explicit Dispatcher(Worker& worker);

    // An exclusive command changes session state, so it is rejected as
    // BUSY while an asynchronous command is in flight.
    void add_command(const std::string& name, SyncHandler handler,
                     const std::string& help, const std::string& group = "General",
                     bool exclusive = false);
    void add_async_command(const std::string& name, AsyncHandler handler,
                           const std::string& help, const std::string& group = "General");

    CommandResult execute(const std::string& line);

    // False when the command is not asynchronous (run it with execute()).
    // Otherwise events and exactly one completion follow, from the worker,
    // or immediately on this thread when rejected as BUSY.
    bool execute_async(const std::string& line, OutputHandler on_output,
                       CompletionHandler on_complete);

    // Empty for commands that are not asynchronous.
    std::optional<CommandTask> submit(const std::string& line);

    bool has_command(const std::string& name) const;
    bool is_async(const std::string& name) const;
    bool busy() const { return in_flight_; }

    std::string help_text() const;

private:
    struct SyncEntry {
        SyncHandler handler;
        std::string help;
        std::string group;
        bool exclusive = false;
    };
    struct AsyncEntry {
        AsyncHandler handler;
        std::string help;
        std::string group;
    };

    Worker& worker_;
    std::map<std::string, SyncEntry> commands_;
    std::map<std::string, AsyncEntry> async_commands_;
    std::vector<std::string> groups_;     // in registration order
    std::atomic<bool> in_flight_{false};

    void note_group(const std::string& group);
};
