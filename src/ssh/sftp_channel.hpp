#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// SFTP subsystem on a libssh2 session (non-blocking mode). Owns the SFTP
// handle; shutdown happens in close() or the destructor.
class Libssh2SftpChannel : public SftpChannel {
public:
    Libssh2SftpChannel(LIBSSH2_SFTP* sftp, LIBSSH2_SESSION* session,
                       std::shared_ptr<std::mutex> io_mutex);
    ~Libssh2SftpChannel() override;

    Result<std::vector<DirectoryEntry>> list(const std::string& path) override;
    Result<DirectoryEntry> stat(const std::string& path) override;
    Result<uint64_t> read_to(const std::string& remote, std::ostream& out) override;
    Result<uint64_t> write_from(std::istream& in, const std::string& remote) override;
    Result<void> mkdir(const std::string& path) override;
    Result<void> unlink(const std::string& path) override;
    Result<void> rmdir(const std::string& path) override;
    void close() override;

    Libssh2SftpChannel(const Libssh2SftpChannel&) = delete;
    Libssh2SftpChannel& operator=(const Libssh2SftpChannel&) = delete;

private:
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;

    // Human-readable text for a failed call: the stall timeout, or the last
    // SFTP status code.
    std::string last_error(long rc);
};
