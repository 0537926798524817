#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

// The secure-channel primitive the session is built on. Production code
// uses Libssh2Transport; tests substitute an in-memory implementation.
//
// A Transport is driven by exactly one Session. Sub-channels it hands out
// must be closed before the transport itself is closed.

// PTY-backed interactive channel.
class ShellChannel {
public:
    // read() return values besides a positive byte count
    static constexpr int WOULD_BLOCK = 0;
    static constexpr int CLOSED = -1;
    static constexpr int FAILED = -2;

    virtual ~ShellChannel() = default;

    // Non-blocking read of stdout and stderr, in the order they arrive.
    virtual int read(char* buf, size_t len) = 0;

    // Write everything or fail.
    virtual bool write(const std::string& data) = 0;

    virtual bool resize(int cols, int rows) = 0;

    // True while the remote end has not closed the channel.
    virtual bool is_open() = 0;

    // Block up to timeout_ms for the channel to have something to read.
    virtual void wait_readable(int timeout_ms) = 0;

    virtual void close() = 0;
};

// SFTP subsystem channel.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    // Entries of `path`, without "." and "..".
    virtual Result<std::vector<DirectoryEntry>> list(const std::string& path) = 0;

    virtual Result<DirectoryEntry> stat(const std::string& path) = 0;

    // Stream a remote file into `out`. Returns bytes copied.
    virtual Result<uint64_t> read_to(const std::string& remote, std::ostream& out) = 0;

    // Create/truncate a remote file from `in`. Returns bytes copied.
    virtual Result<uint64_t> write_from(std::istream& in, const std::string& remote) = 0;

    virtual Result<void> mkdir(const std::string& path) = 0;
    virtual Result<void> unlink(const std::string& path) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;

    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // TCP connect + SSH handshake. Failures carry TRANSPORT or TIMEOUT.
    virtual Result<void> open(const std::string& host, int port, int timeout_secs) = 0;

    // Authentication methods the server offers for `user` (may be empty
    // when the server does not say).
    virtual std::vector<std::string> auth_methods(const std::string& user) = 0;

    virtual Result<void> auth_password(const std::string& user,
                                       const std::string& password) = 0;

    // Answers every keyboard-interactive prompt with `password`.
    virtual Result<void> auth_keyboard_interactive(const std::string& user,
                                                   const std::string& password) = 0;

    virtual Result<void> auth_publickey(const std::string& user,
                                        const std::string& private_key_path,
                                        const std::string& passphrase) = 0;

    virtual bool authenticated() = 0;

    // Keepalive round trip plus socket check.
    virtual bool alive() = 0;

    // Host key fingerprint, e.g. "SHA256:AB:CD:...". Empty before open().
    virtual std::string fingerprint() const = 0;

    // Run a command on a fresh exec channel until it exits or timeout_secs
    // elapses. Each fragment read is passed to on_chunk (if set) in order.
    virtual Result<SSHResult> exec(const std::string& command, int timeout_secs,
                                   const ChunkCallback& on_chunk) = 0;

    virtual Result<std::unique_ptr<ShellChannel>> open_shell(const PtyRequest& pty) = 0;

    virtual Result<std::unique_ptr<SftpChannel>> open_sftp() = 0;

    // Disconnect and release everything. Safe to call more than once.
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
