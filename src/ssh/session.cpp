#include "session.hpp"
#include "auth.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED:   return "disconnected";
        case SessionState::CONNECTING:     return "connecting";
        case SessionState::AUTHENTICATING: return "authenticating";
        case SessionState::CONNECTED:      return "connected";
        case SessionState::ERROR:          return "error";
    }
    return "unknown";
}

SessionOptions SessionOptions::from_config(const Config& config) {
    SessionOptions opts;
    opts.connect_timeout = config.timeouts().connect;
    opts.exec_timeout = config.timeouts().exec;
    opts.stream_timeout = config.timeouts().stream;
    opts.pty = config.pty();
    return opts;
}

static const char* NOT_CONNECTED_MSG =
    "ssh: not connected. Use 'ssh user@host' and 'ssh-login <password>' first.";

Session::Session(TransportFactory factory, SessionOptions options)
    : factory_(std::move(factory)), options_(std::move(options)),
      shell_(*this), sftp_(*this) {
}

Session::~Session() {
    disconnect();
}

// ── Connect ────────────────────────────────────────────────

Result<std::string> Session::connect(const std::string& host, int port,
                                     const std::string& username, const std::string& password,
                                     const StatusCallback& callback) {
    return run_attempt(host, port, username, password, "",
        [this, &username](Transport& t, const StatusCallback& cb) -> Result<void> {
            auto methods = t.auth_methods(username);
            if (t.authenticated()) return Result<void>::Ok();

            bool try_password = methods.empty() || offers_method(methods, "password");
            bool try_kbd = offers_method(methods, "keyboard-interactive");
            if (!try_password && !try_kbd) {
                return Result<void>::Err(ErrorKind::AUTH,
                    "Server does not accept password authentication (offers: " +
                    join(methods, ",") + ")");
            }

            Result<void> auth = Result<void>::Err(ErrorKind::AUTH, "Authentication failed");
            if (try_password) {
                auth = t.auth_password(username, password_);
                if (auth.is_ok() || auth.kind == ErrorKind::TRANSPORT ||
                    auth.kind == ErrorKind::TIMEOUT) return auth;
            }
            if (try_kbd) {
                if (cb) cb("Using keyboard-interactive auth...");
                auth = t.auth_keyboard_interactive(username, password_);
            }
            return auth;
        },
        callback);
}

Result<std::string> Session::connect_with_key(const std::string& host, int port,
                                              const std::string& username,
                                              const std::string& key_path,
                                              const std::string& passphrase,
                                              const StatusCallback& callback) {
    std::string key = expand_home(key_path).string();
    return run_attempt(host, port, username, "", passphrase,
        [this, &username, key](Transport& t, const StatusCallback& cb) -> Result<void> {
            if (cb) cb("Using public key " + key + "...");
            return t.auth_publickey(username, key, passphrase_);
        },
        callback);
}

Result<std::string> Session::run_attempt(const std::string& host, int port,
                                         const std::string& username,
                                         const std::string& password,
                                         const std::string& passphrase,
                                         const AuthStep& authenticate,
                                         const StatusCallback& callback) {
    std::lock_guard<std::mutex> op(op_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::DISCONNECTED && state_ != SessionState::ERROR) {
            std::string msg = (state_ == SessionState::CONNECTED)
                ? fmt::format("Already connected to: {}@{}:{}. Use 'exit' to disconnect.",
                              username_, host_, port_)
                : std::string("ssh: a connection attempt is already in progress");
            return Result<std::string>::Err(ErrorKind::PRECONDITION, msg);
        }
        host_ = host;
        port_ = port;
        username_ = username;
        password_ = password;
        passphrase_ = passphrase;
        last_error_.clear();
        state_ = SessionState::CONNECTING;
    }

    seacmd_log(fmt::format("session: connecting to {}@{}:{}", username, host, port));
    if (callback) callback(fmt::format("Connecting to {}@{}:{}...", username, host, port));

    std::unique_ptr<Transport> transport = factory_();
    if (!transport) {
        return fail_attempt(nullptr, ErrorKind::TRANSPORT, "No transport available");
    }

    auto opened = transport->open(host, port, options_.connect_timeout);
    if (opened.is_err()) {
        ErrorKind kind = opened.kind == ErrorKind::TIMEOUT ? ErrorKind::TIMEOUT : ErrorKind::TRANSPORT;
        return fail_attempt(std::move(transport), kind, opened.error);
    }

    set_state(SessionState::AUTHENTICATING);
    if (callback) callback("Authenticating...");

    auto auth = authenticate(*transport, callback);
    wipe_credentials();
    if (auth.is_err()) {
        ErrorKind kind = auth.kind == ErrorKind::TRANSPORT ? ErrorKind::TRANSPORT
                       : auth.kind == ErrorKind::TIMEOUT   ? ErrorKind::TIMEOUT
                       : auth.kind == ErrorKind::LOCAL_IO  ? ErrorKind::LOCAL_IO
                       : ErrorKind::AUTH;
        return fail_attempt(std::move(transport), kind, auth.error);
    }

    std::string connected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = std::move(transport);
        state_ = SessionState::CONNECTED;
        connected = fmt::format("Connected to {}@{}:{}", username_, host_, port_);
    }
    seacmd_log("session: " + connected);
    return Result<std::string>::Ok(connected);
}

Result<std::string> Session::fail_attempt(std::unique_ptr<Transport> transport,
                                          ErrorKind kind, const std::string& reason) {
    if (transport) transport->close();
    wipe_credentials();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::ERROR;
        last_error_ = reason;
    }
    seacmd_log(fmt::format("session: attempt failed ({}): {}", error_kind_name(kind), reason));
    return Result<std::string>::Err(kind, reason);
}

void Session::set_state(SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Session::wipe_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    wipe(password_);
    wipe(passphrase_);
}

// ── Teardown ───────────────────────────────────────────────

void Session::disconnect() {
    std::lock_guard<std::mutex> op(op_mutex_);
    teardown_locked("");
}

void Session::teardown_locked(const std::string& reason) {
    shell_.close();
    sftp_.close();

    std::unique_ptr<Transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = std::move(transport_);
    }
    if (transport) {
        transport->close();
        seacmd_log(reason.empty() ? "session: disconnected" : "session: torn down: " + reason);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    wipe(password_);
    wipe(passphrase_);
    host_.clear();
    username_.clear();
    port_ = 0;
    last_error_ = reason;
    state_ = SessionState::DISCONNECTED;
}

// ── Usability ──────────────────────────────────────────────

Result<void> Session::require_usable_locked() {
    Transport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::CONNECTED || !transport_) {
            return Result<void>::Err(ErrorKind::PRECONDITION, NOT_CONNECTED_MSG);
        }
        transport = transport_.get();
    }
    if (!transport->alive()) {
        teardown_locked("session disconnected");
        return Result<void>::Err(ErrorKind::DISCONNECTED, "session disconnected");
    }
    return Result<void>::Ok();
}

Result<void> Session::require_usable() {
    std::lock_guard<std::mutex> op(op_mutex_);
    return require_usable_locked();
}

bool Session::is_usable() {
    // A running operation owns the transport; report the recorded state.
    std::unique_lock<std::mutex> op(op_mutex_, std::try_to_lock);
    if (!op.owns_lock()) return is_connected();
    return require_usable_locked().is_ok();
}

// ── Remote execution ───────────────────────────────────────

CommandResult Session::execute_command(const std::string& command) {
    std::lock_guard<std::mutex> op(op_mutex_);
    return run_exec_locked(command, options_.exec_timeout, nullptr);
}

CommandResult Session::execute_command_streaming(const std::string& command,
                                                 const ChunkCallback& on_chunk) {
    std::lock_guard<std::mutex> op(op_mutex_);
    return run_exec_locked(command, options_.stream_timeout, on_chunk);
}

CommandResult Session::run_exec_locked(const std::string& command, int timeout_secs,
                                       const ChunkCallback& on_chunk) {
    auto usable = require_usable_locked();
    if (usable.is_err()) return CommandResult::fail(usable.kind, usable.error);

    // Fragments are collected here too so a timeout can still return them.
    std::string received;
    auto r = transport_->exec(command, timeout_secs, [&](const std::string& chunk) {
        received += chunk;
        if (on_chunk) on_chunk(chunk);
    });

    if (r.is_err()) {
        if (r.kind == ErrorKind::DISCONNECTED) {
            teardown_locked("session disconnected");
            return CommandResult::fail(ErrorKind::DISCONNECTED, "session disconnected");
        }
        if (r.kind == ErrorKind::TIMEOUT && !received.empty()) {
            return CommandResult::fail(ErrorKind::TIMEOUT, received + "\n" + r.error);
        }
        return CommandResult::fail(r.kind, r.error);
    }

    const SSHResult& res = r.value;
    std::string output = on_chunk ? received : res.stdout_data + res.stderr_data;
    if (output.empty()) output = NO_OUTPUT_MARKER;
    if (res.exit_code > 0) {
        if (output.back() != '\n') output += '\n';
        output += fmt::format("[exit status {}]", res.exit_code);
    }
    return CommandResult::ok(output);
}

// ── Sub-sessions ───────────────────────────────────────────

Result<void> Session::open_shell() {
    std::lock_guard<std::mutex> op(op_mutex_);
    auto usable = require_usable_locked();
    if (usable.is_err()) return usable;

    auto ch = transport_->open_shell(options_.pty);
    if (ch.is_err()) return Result<void>::Err(ch.kind, ch.error);
    shell_.attach(std::move(ch.value));
    return Result<void>::Ok();
}

Result<void> Session::open_sftp() {
    std::lock_guard<std::mutex> op(op_mutex_);
    auto usable = require_usable_locked();
    if (usable.is_err()) return usable;

    auto ch = transport_->open_sftp();
    if (ch.is_err()) {
        if (ch.kind == ErrorKind::DISCONNECTED) teardown_locked("session disconnected");
        return Result<void>::Err(ch.kind, ch.error);
    }
    sftp_.attach(std::move(ch.value));
    return Result<void>::Ok();
}

// ── Observers ──────────────────────────────────────────────

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

const char* Session::state_name() const {
    return session_state_name(state());
}

bool Session::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::CONNECTED;
}

std::string Session::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string Session::connection_string() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::CONNECTED) return "Not connected";
    return fmt::format("{}@{}:{}", username_, host_, port_);
}

std::string Session::fingerprint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::CONNECTED || !transport_) return "";
    return transport_->fingerprint();
}

bool Session::holds_credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !password_.empty() || !passphrase_.empty();
}
