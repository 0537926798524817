#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"
#include "interactive_shell.hpp"
#include "file_transfer.hpp"

class Config;

enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    AUTHENTICATING,
    CONNECTED,
    ERROR,
};

const char* session_state_name(SessionState state);

struct SessionOptions {
    int connect_timeout = 30;
    int exec_timeout = 60;
    int stream_timeout = 300;
    PtyRequest pty;

    static SessionOptions from_config(const Config& config);
};

// One remote session and its lifecycle. Constructed once by main and
// passed by reference; every state change goes through its own methods.
//
// Lock order: op_mutex_ (held for the length of a transport operation),
// then mutex_ (state fields, brief), then the shell/SFTP objects' mutexes.
class Session {
public:
    explicit Session(TransportFactory factory, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Password login; falls back to keyboard-interactive with the same
    // password when the server offers it. Valid from DISCONNECTED or ERROR.
    Result<std::string> connect(const std::string& host, int port,
                                const std::string& username, const std::string& password,
                                const StatusCallback& callback = nullptr);

    // Public-key login only.
    Result<std::string> connect_with_key(const std::string& host, int port,
                                         const std::string& username,
                                         const std::string& key_path,
                                         const std::string& passphrase,
                                         const StatusCallback& callback = nullptr);

    // Close shell, SFTP and transport; back to DISCONNECTED. Idempotent.
    void disconnect();

    // CONNECTED and the transport still answers. A dead transport tears the
    // session down as a side effect.
    bool is_usable();

    CommandResult execute_command(const std::string& command);
    CommandResult execute_command_streaming(const std::string& command,
                                            const ChunkCallback& on_chunk);

    SessionState state() const;
    const char* state_name() const;
    bool is_connected() const;
    bool is_authenticated() const { return is_connected(); }
    std::string last_error() const;
    std::string connection_string() const;
    std::string fingerprint() const;

    // True while a password or passphrase is held (only during an attempt).
    bool holds_credentials() const;

    InteractiveShell& shell() { return shell_; }
    FileTransfer& sftp() { return sftp_; }
    const SessionOptions& options() const { return options_; }

private:
    friend class InteractiveShell;
    friend class FileTransfer;

    using AuthStep = std::function<Result<void>(Transport&, const StatusCallback&)>;

    TransportFactory factory_;
    SessionOptions options_;

    mutable std::mutex op_mutex_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::DISCONNECTED;
    std::string host_;
    int port_ = 0;
    std::string username_;
    std::string password_;
    std::string passphrase_;
    std::string last_error_;
    std::unique_ptr<Transport> transport_;

    InteractiveShell shell_;
    FileTransfer sftp_;

    // Stores the secret and enters CONNECTING under one lock, with
    // op_mutex_ held for the whole attempt.
    Result<std::string> run_attempt(const std::string& host, int port,
                                    const std::string& username,
                                    const std::string& password,
                                    const std::string& passphrase,
                                    const AuthStep& authenticate,
                                    const StatusCallback& callback);
    Result<std::string> fail_attempt(std::unique_ptr<Transport> transport,
                                     ErrorKind kind, const std::string& reason);
    void set_state(SessionState state);
    void wipe_credentials();

    // Callers hold op_mutex_.
    Result<void> require_usable_locked();
    void teardown_locked(const std::string& reason);
    CommandResult run_exec_locked(const std::string& command, int timeout_secs,
                                  const ChunkCallback& on_chunk);

    // Used by the sub-session objects.
    Result<void> require_usable();
    Result<void> open_shell();
    Result<void> open_sftp();
};
