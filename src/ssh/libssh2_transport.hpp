#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Transport on a non-blocking libssh2 session. Every libssh2 call holds
// io_mutex_ briefly; the shell and SFTP channels share the same mutex so a
// reader thread can interleave with writers.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Result<void> open(const std::string& host, int port, int timeout_secs) override;
    std::vector<std::string> auth_methods(const std::string& user) override;
    Result<void> auth_password(const std::string& user, const std::string& password) override;
    Result<void> auth_keyboard_interactive(const std::string& user,
                                           const std::string& password) override;
    Result<void> auth_publickey(const std::string& user, const std::string& private_key_path,
                                const std::string& passphrase) override;
    bool authenticated() override;
    bool alive() override;
    std::string fingerprint() const override;

    Result<SSHResult> exec(const std::string& command, int timeout_secs,
                           const ChunkCallback& on_chunk) override;
    Result<std::unique_ptr<ShellChannel>> open_shell(const PtyRequest& pty) override;
    Result<std::unique_ptr<SftpChannel>> open_sftp() override;

    void close() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

private:
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::string fingerprint_;
    // Set once the handshake completes; bounds every auth round trip.
    std::chrono::steady_clock::time_point auth_deadline_;

    // libssh2's description of the last session error.
    std::string last_error();

    // Map a failed userauth return code to a result.
    Result<void> auth_failure(int rc, const std::string& method);

    // Open a session channel, retrying on EAGAIN until the channel-open timeout.
    Result<LIBSSH2_CHANNEL*> open_channel();

    // Close and free a channel. Returns the remote exit status (-1 if unknown).
    int free_channel(LIBSSH2_CHANNEL* ch);
};

// Factory used by main; tests pass their own.
TransportFactory libssh2_transport_factory();
