#include "sftp_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <istream>
#include <ostream>
#include <vector>

using Clock = std::chrono::steady_clock;

static Clock::time_point stall_deadline() {
    return Clock::now() + std::chrono::seconds(SFTP_STALL_TIMEOUT_SECS);
}

// Repeat an int-returning libssh2 call while it reports EAGAIN.
// LIBSSH2_ERROR_TIMEOUT when the request makes no progress in time.
template <typename Fn>
static long call_rc(std::mutex& io_mutex, Fn fn) {
    auto deadline = stall_deadline();
    while (true) {
        long rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = static_cast<long>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

// Repeat a handle-returning libssh2 call while the session reports EAGAIN.
// On nullptr, `rc` holds the session error or LIBSSH2_ERROR_TIMEOUT.
template <typename Fn>
static LIBSSH2_SFTP_HANDLE* call_handle(std::mutex& io_mutex, LIBSSH2_SESSION* session,
                                        long& rc, Fn fn) {
    auto deadline = stall_deadline();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            LIBSSH2_SFTP_HANDLE* h = fn();
            if (h) {
                rc = 0;
                return h;
            }
            rc = libssh2_session_last_errno(session);
            if (rc != LIBSSH2_ERROR_EAGAIN) return nullptr;
        }
        if (Clock::now() >= deadline) {
            rc = LIBSSH2_ERROR_TIMEOUT;
            return nullptr;
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

static ErrorKind kind_of(long rc) {
    return rc == LIBSSH2_ERROR_TIMEOUT ? ErrorKind::TIMEOUT : ErrorKind::REMOTE;
}

static DirectoryEntry entry_from_attrs(std::string name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    DirectoryEntry e;
    e.name = std::move(name);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.permissions = static_cast<uint32_t>(attrs.permissions);
        e.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = attrs.mtime;
    return e;
}

Libssh2SftpChannel::Libssh2SftpChannel(LIBSSH2_SFTP* sftp, LIBSSH2_SESSION* session,
                                       std::shared_ptr<std::mutex> io_mutex)
    : sftp_(sftp), session_(session), io_mutex_(std::move(io_mutex)) {}

Libssh2SftpChannel::~Libssh2SftpChannel() {
    close();
}

void Libssh2SftpChannel::close() {
    if (!sftp_) return;
    call_rc(*io_mutex_, [&] { return libssh2_sftp_shutdown(sftp_); });
    sftp_ = nullptr;
}

std::string Libssh2SftpChannel::last_error(long rc) {
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return fmt::format("no response for {}s", SFTP_STALL_TIMEOUT_SECS);
    }
    unsigned long code;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        code = libssh2_sftp_last_error(sftp_);
    }
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:        return "No such file or directory";
        case LIBSSH2_FX_PERMISSION_DENIED:   return "Permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "File already exists";
        case LIBSSH2_FX_DIR_NOT_EMPTY:       return "Directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:     return "Not a directory";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:      return "No space left on remote filesystem";
        case LIBSSH2_FX_WRITE_PROTECT:       return "Remote filesystem is read-only";
        case LIBSSH2_FX_OK:                  return "Channel error";
        default:                             return fmt::format("SFTP error {}", code);
    }
}

Result<std::vector<DirectoryEntry>> Libssh2SftpChannel::list(const std::string& path) {
    if (!sftp_) return Result<std::vector<DirectoryEntry>>::Err(ErrorKind::PRECONDITION, "SFTP closed");

    long rc = 0;
    LIBSSH2_SFTP_HANDLE* dir = call_handle(*io_mutex_, session_, rc, [&] {
        return libssh2_sftp_opendir(sftp_, path.c_str());
    });
    if (!dir) {
        return Result<std::vector<DirectoryEntry>>::Err(
            kind_of(rc), "Cannot open directory '" + path + "': " + last_error(rc));
    }

    std::vector<DirectoryEntry> out;
    char filename[512];
    char longentry[1024];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs{};
        rc = call_rc(*io_mutex_, [&] {
            return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                           longentry, sizeof(longentry), &attrs);
        });
        if (rc == 0) break;  // end of directory
        if (rc < 0) {
            std::string why = last_error(rc);
            call_rc(*io_mutex_, [&] { return libssh2_sftp_closedir(dir); });
            return Result<std::vector<DirectoryEntry>>::Err(
                kind_of(rc), "Failed reading directory '" + path + "': " + why);
        }
        std::string name(filename, static_cast<size_t>(rc));
        if (name == "." || name == "..") continue;
        out.push_back(entry_from_attrs(std::move(name), attrs));
    }

    call_rc(*io_mutex_, [&] { return libssh2_sftp_closedir(dir); });
    return Result<std::vector<DirectoryEntry>>::Ok(std::move(out));
}

Result<DirectoryEntry> Libssh2SftpChannel::stat(const std::string& path) {
    if (!sftp_) return Result<DirectoryEntry>::Err(ErrorKind::PRECONDITION, "SFTP closed");

    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    long rc = call_rc(*io_mutex_, [&] {
        return libssh2_sftp_stat(sftp_, path.c_str(), &attrs);
    });
    if (rc != 0) {
        return Result<DirectoryEntry>::Err(kind_of(rc),
                                           "Cannot stat '" + path + "': " + last_error(rc));
    }
    auto slash = path.find_last_of('/');
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return Result<DirectoryEntry>::Ok(entry_from_attrs(base, attrs));
}

Result<uint64_t> Libssh2SftpChannel::read_to(const std::string& remote, std::ostream& out) {
    if (!sftp_) return Result<uint64_t>::Err(ErrorKind::PRECONDITION, "SFTP closed");

    long rc = 0;
    LIBSSH2_SFTP_HANDLE* fh = call_handle(*io_mutex_, session_, rc, [&] {
        return libssh2_sftp_open(sftp_, remote.c_str(), LIBSSH2_FXF_READ, 0);
    });
    if (!fh) {
        return Result<uint64_t>::Err(kind_of(rc),
                                     "Cannot open remote file '" + remote + "': " + last_error(rc));
    }

    std::vector<char> buf(SFTP_BUF_SIZE);
    uint64_t total = 0;
    while (true) {
        long n = call_rc(*io_mutex_, [&] {
            return libssh2_sftp_read(fh, buf.data(), buf.size());
        });
        if (n == 0) break;
        if (n < 0) {
            std::string why = last_error(n);
            call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
            return Result<uint64_t>::Err(kind_of(n), "Read failed on '" + remote + "': " + why);
        }
        out.write(buf.data(), n);
        if (!out) {
            call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
            return Result<uint64_t>::Err(ErrorKind::LOCAL_IO, "Local write failed");
        }
        total += static_cast<uint64_t>(n);
    }

    call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
    return Result<uint64_t>::Ok(total);
}

Result<uint64_t> Libssh2SftpChannel::write_from(std::istream& in, const std::string& remote) {
    if (!sftp_) return Result<uint64_t>::Err(ErrorKind::PRECONDITION, "SFTP closed");

    long rc = 0;
    LIBSSH2_SFTP_HANDLE* fh = call_handle(*io_mutex_, session_, rc, [&] {
        return libssh2_sftp_open(sftp_, remote.c_str(),
                                 LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                 LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                 LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    });
    if (!fh) {
        return Result<uint64_t>::Err(kind_of(rc),
                                     "Cannot create remote file '" + remote + "': " + last_error(rc));
    }

    std::vector<char> buf(SFTP_BUF_SIZE);
    uint64_t total = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        std::streamsize sent = 0;
        while (sent < got) {
            long n = call_rc(*io_mutex_, [&] {
                return libssh2_sftp_write(fh, buf.data() + sent, static_cast<size_t>(got - sent));
            });
            if (n < 0) {
                std::string why = last_error(n);
                call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
                return Result<uint64_t>::Err(kind_of(n), "Write failed on '" + remote + "': " + why);
            }
            sent += n;
        }
        total += static_cast<uint64_t>(got);
    }

    if (in.bad()) {
        call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
        return Result<uint64_t>::Err(ErrorKind::LOCAL_IO, "Local read failed");
    }

    rc = call_rc(*io_mutex_, [&] { return libssh2_sftp_close(fh); });
    if (rc != 0) {
        return Result<uint64_t>::Err(kind_of(rc),
                                     "Closing '" + remote + "' failed: " + last_error(rc));
    }
    return Result<uint64_t>::Ok(total);
}

Result<void> Libssh2SftpChannel::mkdir(const std::string& path) {
    if (!sftp_) return Result<void>::Err(ErrorKind::PRECONDITION, "SFTP closed");
    long rc = call_rc(*io_mutex_, [&] {
        return libssh2_sftp_mkdir(sftp_, path.c_str(),
                                  LIBSSH2_SFTP_S_IRWXU |
                                  LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP |
                                  LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IXOTH);
    });
    if (rc != 0) {
        return Result<void>::Err(kind_of(rc),
                                 "Cannot create directory '" + path + "': " + last_error(rc));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::unlink(const std::string& path) {
    if (!sftp_) return Result<void>::Err(ErrorKind::PRECONDITION, "SFTP closed");
    long rc = call_rc(*io_mutex_, [&] { return libssh2_sftp_unlink(sftp_, path.c_str()); });
    if (rc != 0) {
        return Result<void>::Err(kind_of(rc),
                                 "Cannot remove '" + path + "': " + last_error(rc));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::rmdir(const std::string& path) {
    if (!sftp_) return Result<void>::Err(ErrorKind::PRECONDITION, "SFTP closed");
    long rc = call_rc(*io_mutex_, [&] { return libssh2_sftp_rmdir(sftp_, path.c_str()); });
    if (rc != 0) {
        return Result<void>::Err(kind_of(rc),
                                 "Cannot remove directory '" + path + "': " + last_error(rc));
    }
    return Result<void>::Ok();
}
