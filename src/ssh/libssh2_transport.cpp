#include "libssh2_transport.hpp"
#include "auth.hpp"
#include "shell_channel.hpp"
#include "sftp_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <mutex>

using Clock = std::chrono::steady_clock;

static void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

// True for libssh2 errors that mean the connection itself is gone.
static bool is_connection_error(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
}

// Repeat a libssh2 call while it reports EAGAIN. LIBSSH2_ERROR_TIMEOUT once
// `deadline` passes.
template <typename Fn>
static int retry_until(std::mutex& io_mutex, Clock::time_point deadline, Fn fn) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

static Clock::time_point channel_deadline() {
    return Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
}

Libssh2Transport::Libssh2Transport()
    : session_(nullptr), sock_(SEACMD_INVALID_SOCKET),
      io_mutex_(std::make_shared<std::mutex>()) {
}

Libssh2Transport::~Libssh2Transport() {
    close();
}

std::string Libssh2Transport::last_error() {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

Result<void> Libssh2Transport::open(const std::string& host, int port, int timeout_secs) {
    ensure_libssh2_init();
    close();

    auto sock = platform::connect_tcp(host, port, timeout_secs * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(sock.kind, sock.error);
    }
    sock_ = sock.value;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err(ErrorKind::TRANSPORT, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) {
            close();
            return Result<void>::Err(ErrorKind::TIMEOUT,
                                     fmt::format("SSH handshake with {}:{} timed out", host, port));
        }
        platform::poll_socket(sock_, POLLIN, EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        std::string why = last_error();
        close();
        return Result<void>::Err(ErrorKind::TRANSPORT, "SSH handshake failed: " + why);
    }

    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        std::string fp = "SHA256:";
        for (int i = 0; i < 32; i++) {
            if (i > 0) fp += ':';
            fp += fmt::format("{:02X}", static_cast<unsigned char>(hash[i]));
        }
        fingerprint_ = fp;
    }

    auth_deadline_ = Clock::now() + std::chrono::seconds(timeout_secs);

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, KEEPALIVE_INTERVAL_SECS);

    seacmd_log(fmt::format("transport: handshake complete with {}:{} ({})", host, port, fingerprint_));
    return Result<void>::Ok();
}

std::vector<std::string> Libssh2Transport::auth_methods(const std::string& user) {
    if (!session_) return {};

    while (true) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            char* list = libssh2_userauth_list(session_, user.c_str(),
                                               static_cast<unsigned int>(user.length()));
            if (list) return parse_auth_methods(list);
            if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) return {};
        }
        if (Clock::now() >= auth_deadline_) {
            seacmd_log("transport: timed out waiting for the auth method list");
            return {};
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

Result<void> Libssh2Transport::auth_failure(int rc, const std::string& method) {
    seacmd_log(fmt::format("transport: {} auth failed rc={} ({})", method, rc, last_error()));
    switch (rc) {
        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_PASSWORD_EXPIRED:
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
            return Result<void>::Err(ErrorKind::AUTH,
                                     "Authentication failed (" + method + " rejected)");
        case LIBSSH2_ERROR_TIMEOUT:
            return Result<void>::Err(ErrorKind::TIMEOUT,
                                     "Authentication timed out (" + method + ")");
        case LIBSSH2_ERROR_FILE:
            return Result<void>::Err(ErrorKind::LOCAL_IO,
                                     "Cannot read private key: " + last_error());
        default:
            if (is_connection_error(rc)) {
                return Result<void>::Err(ErrorKind::TRANSPORT,
                                         "Connection lost during authentication: " + last_error());
            }
            return Result<void>::Err(ErrorKind::AUTH,
                                     "Authentication failed: " + last_error());
    }
}

Result<void> Libssh2Transport::auth_password(const std::string& user,
                                             const std::string& password) {
    if (!session_) return Result<void>::Err(ErrorKind::PRECONDITION, "Transport not open");

    int rc = retry_until(*io_mutex_, auth_deadline_, [&] {
        return libssh2_userauth_password(session_, user.c_str(), password.c_str());
    });
    if (rc != 0) return auth_failure(rc, "password");
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::auth_keyboard_interactive(const std::string& user,
                                                         const std::string& password) {
    if (!session_) return Result<void>::Err(ErrorKind::PRECONDITION, "Transport not open");

    KbdAuthData data;
    data.password = &password;

    int rc;
    {
        KbdAuthScope scope(session_, &data);
        rc = retry_until(*io_mutex_, auth_deadline_, [&] {
            return libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                         seacmd_kbd_callback);
        });
    }
    seacmd_log(fmt::format("transport: keyboard-interactive rounds={} prompts={}",
                           data.prompt_round, data.prompts_answered));
    if (rc != 0) return auth_failure(rc, "keyboard-interactive");
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::auth_publickey(const std::string& user,
                                              const std::string& private_key_path,
                                              const std::string& passphrase) {
    if (!session_) return Result<void>::Err(ErrorKind::PRECONDITION, "Transport not open");

    int rc = retry_until(*io_mutex_, auth_deadline_, [&] {
        return libssh2_userauth_publickey_fromfile(
            session_, user.c_str(), nullptr, private_key_path.c_str(),
            passphrase.empty() ? nullptr : passphrase.c_str());
    });
    if (rc != 0) return auth_failure(rc, "publickey");
    return Result<void>::Ok();
}

bool Libssh2Transport::authenticated() {
    if (!session_) return false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_userauth_authenticated(session_) != 0;
}

bool Libssh2Transport::alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!session_ || sock_ == SEACMD_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) return false;

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) return false;
    return true;
}

std::string Libssh2Transport::fingerprint() const {
    return fingerprint_;
}

Result<LIBSSH2_CHANNEL*> Libssh2Transport::open_channel() {
    if (!session_) return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::DISCONNECTED, "No session");

    auto deadline = Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
            if (ch) return Result<LIBSSH2_CHANNEL*>::Ok(ch);
            int err = libssh2_session_last_errno(session_);
            if (err != LIBSSH2_ERROR_EAGAIN) {
                return Result<LIBSSH2_CHANNEL*>::Err(
                    is_connection_error(err) ? ErrorKind::DISCONNECTED : ErrorKind::REMOTE,
                    "Failed to open channel: " + last_error());
            }
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::TIMEOUT, "Timed out opening channel");
}

int Libssh2Transport::free_channel(LIBSSH2_CHANNEL* ch) {
    int rc = retry_until(*io_mutex_, channel_deadline(), [&] {
        return libssh2_channel_close(ch);
    });

    // Exit status is only valid once the channel is closed.
    std::lock_guard<std::mutex> lock(*io_mutex_);
    int exit_status = (rc == 0) ? libssh2_channel_get_exit_status(ch) : -1;
    libssh2_channel_free(ch);
    return exit_status;
}

Result<SSHResult> Libssh2Transport::exec(const std::string& command, int timeout_secs,
                                         const ChunkCallback& on_chunk) {
    auto opened = open_channel();
    if (opened.is_err()) return Result<SSHResult>::Err(opened.kind, opened.error);
    LIBSSH2_CHANNEL* ch = opened.value;

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);

    int rc = retry_until(*io_mutex_, deadline, [&] {
        return libssh2_channel_exec(ch, command.c_str());
    });
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        free_channel(ch);
        return Result<SSHResult>::Err(ErrorKind::TIMEOUT,
                                      fmt::format("Command timed out after {}s", timeout_secs));
    }
    if (rc != 0) {
        std::string why = last_error();
        free_channel(ch);
        return Result<SSHResult>::Err(ErrorKind::REMOTE, "Failed to exec command: " + why);
    }

    SSHResult result{-1, "", ""};
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;

    while (Clock::now() < deadline) {
        ssize_t out_n, err_n;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            out_n = libssh2_channel_read(ch, buf, sizeof(buf));
            if (out_n > 0) result.stdout_data.append(buf, static_cast<size_t>(out_n));
        }
        if (out_n > 0 && on_chunk) on_chunk(std::string(buf, static_cast<size_t>(out_n)));

        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            err_n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (err_n > 0) result.stderr_data.append(buf, static_cast<size_t>(err_n));
        }
        if (err_n > 0 && on_chunk) on_chunk(std::string(buf, static_cast<size_t>(err_n)));

        if ((out_n < 0 && out_n != LIBSSH2_ERROR_EAGAIN) ||
            (err_n < 0 && err_n != LIBSSH2_ERROR_EAGAIN)) {
            int err = static_cast<int>(out_n < 0 && out_n != LIBSSH2_ERROR_EAGAIN ? out_n : err_n);
            std::string why = last_error();
            free_channel(ch);
            return Result<SSHResult>::Err(
                is_connection_error(err) ? ErrorKind::DISCONNECTED : ErrorKind::REMOTE,
                "SSH channel read error: " + why);
        }

        if (out_n > 0 || err_n > 0) continue;

        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            eof = libssh2_channel_eof(ch) != 0;
        }
        if (eof) {
            timed_out = false;
            break;
        }
        platform::poll_socket(sock_, POLLIN, EAGAIN_SLEEP_MS);
    }

    int exit_status = free_channel(ch);

    if (timed_out) {
        seacmd_log_ssh("exec(timeout)", command, result);
        return Result<SSHResult>::Err(ErrorKind::TIMEOUT,
                                      fmt::format("Command timed out after {}s", timeout_secs));
    }

    result.exit_code = exit_status;
    seacmd_log_ssh("exec", command, result);
    return Result<SSHResult>::Ok(std::move(result));
}

Result<std::unique_ptr<ShellChannel>> Libssh2Transport::open_shell(const PtyRequest& pty) {
    using R = Result<std::unique_ptr<ShellChannel>>;

    auto opened = open_channel();
    if (opened.is_err()) return R::Err(opened.kind, opened.error);
    LIBSSH2_CHANNEL* ch = opened.value;

    auto deadline = channel_deadline();
    int rc = retry_until(*io_mutex_, deadline, [&] {
        return libssh2_channel_request_pty_ex(ch, pty.term.c_str(),
                                              static_cast<unsigned int>(pty.term.size()),
                                              nullptr, 0, pty.cols, pty.rows, 0, 0);
    });
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        free_channel(ch);
        return R::Err(ErrorKind::TIMEOUT, "Timed out requesting a PTY");
    }
    if (rc != 0) {
        std::string why = last_error();
        free_channel(ch);
        return R::Err(ErrorKind::REMOTE, "PTY request failed: " + why);
    }

    rc = retry_until(*io_mutex_, deadline, [&] { return libssh2_channel_shell(ch); });
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        free_channel(ch);
        return R::Err(ErrorKind::TIMEOUT, "Timed out requesting a shell");
    }
    if (rc != 0) {
        std::string why = last_error();
        free_channel(ch);
        return R::Err(ErrorKind::REMOTE, "Failed to request shell: " + why);
    }

    seacmd_log(fmt::format("transport: shell opened ({} {}x{})", pty.term, pty.cols, pty.rows));
    return R::Ok(std::make_unique<Libssh2ShellChannel>(ch, io_mutex_, sock_));
}

Result<std::unique_ptr<SftpChannel>> Libssh2Transport::open_sftp() {
    using R = Result<std::unique_ptr<SftpChannel>>;
    if (!session_) return R::Err(ErrorKind::DISCONNECTED, "No session");

    auto deadline = Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            LIBSSH2_SFTP* sftp = libssh2_sftp_init(session_);
            if (sftp) {
                return R::Ok(std::make_unique<Libssh2SftpChannel>(sftp, session_, io_mutex_));
            }
            int err = libssh2_session_last_errno(session_);
            if (err != LIBSSH2_ERROR_EAGAIN) {
                std::string why = last_error();
                seacmd_log("transport: sftp init failed: " + why);
                if (is_connection_error(err)) {
                    return R::Err(ErrorKind::DISCONNECTED, "session disconnected");
                }
                return R::Err(ErrorKind::NOT_AUTHORIZED,
                              "SFTP not authorized for this session (" + why + ")");
            }
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    return R::Err(ErrorKind::TIMEOUT, "Timed out starting SFTP subsystem");
}

void Libssh2Transport::close() {
    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != SEACMD_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SEACMD_INVALID_SOCKET;
    }
    fingerprint_.clear();
}

TransportFactory libssh2_transport_factory() {
    return [] { return std::make_unique<Libssh2Transport>(); };
}
