#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Why an operation failed. Decided where the failure happens, never
// re-derived later from message text.
enum class ErrorKind {
    NONE,
    PRECONDITION,     // not connected, nothing pending, missing arguments
    TRANSPORT,        // refused, DNS failure, handshake failure
    AUTH,             // credentials rejected
    NOT_AUTHORIZED,   // session up, but the subsystem was denied
    DISCONNECTED,     // transport dropped underneath an open session
    TIMEOUT,
    REMOTE,           // remote side reported a failure
    LOCAL_IO,
    BUSY,             // another async command is in flight
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::NONE};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::REMOTE};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorKind::NONE};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::REMOTE};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Output of one synchronous command, or the final result of a remote
// execution. Immutable once built.
struct CommandResult {
    std::string output;
    bool is_error = false;
    ErrorKind kind = ErrorKind::NONE;

    static CommandResult ok(std::string text) {
        return {std::move(text), false, ErrorKind::NONE};
    }

    static CommandResult fail(ErrorKind kind, std::string text) {
        return {std::move(text), true, kind};
    }

    template <typename T>
    static CommandResult from(const Result<T>& r, std::string ok_text) {
        if (r.is_ok()) return ok(std::move(ok_text));
        return fail(r.kind, r.error);
    }
};

// One entry of a remote directory listing
struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
    uint64_t size = 0;
    uint32_t permissions = 0;   // POSIX mode bits (type + permissions)
    uint64_t mtime = 0;         // epoch seconds
};

// Pseudo-terminal parameters for an interactive shell
struct PtyRequest {
    std::string term = "xterm";
    int cols = 80;
    int rows = 24;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Receives each data fragment of a streaming command, in arrival order
using ChunkCallback = std::function<void(const std::string&)>;

// Configuration structures
struct TerminalSettings {
    std::string type = "xterm";
    int cols = 80;
    int rows = 24;
};

struct TimeoutSettings {
    int connect = 30;
    int exec = 60;
    int stream = 300;
    int pending_login = 120;
};

struct ConnectionDefaults {
    int port = 22;
    std::string key_path;        // used by ssh-login-key when no key is given
};

struct TransferSettings {
    std::string local_dir;       // base for relative local paths (empty = cwd)
};

struct LogSettings {
    bool enabled = true;
    std::string path;            // empty = <tmp>/seacmd_debug.log
};
