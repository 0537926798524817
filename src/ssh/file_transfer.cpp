#include "file_transfer.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

static const char* NOT_STARTED_MSG = "SFTP not connected. Use 'sftp-start' first.";

FileTransfer::FileTransfer(Session& session) : session_(session) {}

FileTransfer::~FileTransfer() {
    close();
}

Result<std::string> FileTransfer::start() {
    if (is_open()) {
        auto usable = session_.require_usable();
        if (usable.is_err()) return Result<std::string>::Err(usable.kind, usable.error);
        return Result<std::string>::Ok("SFTP session started");
    }

    auto r = session_.open_sftp();
    if (r.is_err()) {
        if (r.kind == ErrorKind::NOT_AUTHORIZED) {
            return Result<std::string>::Err(ErrorKind::NOT_AUTHORIZED,
                                            "SFTP not authorized: " + r.error);
        }
        return Result<std::string>::Err(r.kind, r.error);
    }
    return Result<std::string>::Ok("SFTP session started");
}

void FileTransfer::attach(std::unique_ptr<SftpChannel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = std::move(channel);
    open_ = channel_ != nullptr;
    seacmd_log("sftp: started");
}

void FileTransfer::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    if (!channel_) return;
    channel_->close();
    channel_.reset();
    seacmd_log("sftp: closed");
}

Result<void> FileTransfer::ready() {
    if (!is_open()) return Result<void>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);
    auto usable = session_.require_usable();
    if (usable.is_err()) return usable;
    // Teardown may have closed the channel in between.
    if (!is_open()) return Result<void>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);
    return Result<void>::Ok();
}

Result<std::vector<DirectoryEntry>> FileTransfer::list(const std::string& path) {
    using R = Result<std::vector<DirectoryEntry>>;
    auto ok = ready();
    if (ok.is_err()) return R::Err(ok.kind, ok.error);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) return R::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);
    auto r = channel_->list(path.empty() ? "." : path);
    if (r.is_err()) return r;

    auto& entries = r.value;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const DirectoryEntry& e) {
                                     return e.name == "." || e.name == "..";
                                 }),
                  entries.end());
    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) {
                  if (a.is_directory != b.is_directory) return a.is_directory;
                  return a.name < b.name;
              });
    return r;
}

Result<uint64_t> FileTransfer::upload(const fs::path& local, const std::string& remote) {
    auto ok = ready();
    if (ok.is_err()) return Result<uint64_t>::Err(ok.kind, ok.error);

    std::error_code ec;
    if (!fs::is_regular_file(local, ec)) {
        return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                     "Cannot read local file: " + local.string());
    }
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                     "Cannot read local file: " + local.string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) return Result<uint64_t>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);
    auto r = channel_->write_from(in, remote);
    if (r.is_ok()) {
        seacmd_log(fmt::format("sftp: uploaded {} -> {} ({} bytes)", local.string(), remote, r.value));
    }
    return r;
}

Result<uint64_t> FileTransfer::download(const std::string& remote, const fs::path& local) {
    auto ok = ready();
    if (ok.is_err()) return Result<uint64_t>::Err(ok.kind, ok.error);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) return Result<uint64_t>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);

    auto info = channel_->stat(remote);
    if (info.is_err()) return Result<uint64_t>::Err(info.kind, info.error);
    if (info.value.is_directory) {
        return Result<uint64_t>::Err(ErrorKind::REMOTE, "'" + remote + "' is a directory");
    }

    std::error_code ec;
    if (local.has_parent_path()) fs::create_directories(local.parent_path(), ec);
    if (ec) {
        return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                     "Cannot create " + local.parent_path().string() + ": " + ec.message());
    }

    fs::path part = local;
    part += ".part";
    uint64_t bytes = 0;
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                         "Cannot write local file: " + part.string());
        }
        auto r = channel_->read_to(remote, out);
        out.close();
        if (r.is_err() || !out) {
            fs::remove(part, ec);
            if (r.is_err()) return r;
            return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                         "Failed writing local file: " + part.string());
        }
        bytes = r.value;
    }

    fs::rename(part, local, ec);
    if (ec) {
        fs::remove(part, ec);
        return Result<uint64_t>::Err(ErrorKind::LOCAL_IO,
                                     "Cannot move download into place at " + local.string());
    }
    seacmd_log(fmt::format("sftp: downloaded {} -> {} ({} bytes)", remote, local.string(), bytes));
    return Result<uint64_t>::Ok(bytes);
}

Result<void> FileTransfer::mkdir(const std::string& path) {
    auto ok = ready();
    if (ok.is_err()) return ok;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) return Result<void>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);
    return channel_->mkdir(path);
}

Result<void> FileTransfer::remove(const std::string& path) {
    auto ok = ready();
    if (ok.is_err()) return ok;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) return Result<void>::Err(ErrorKind::PRECONDITION, NOT_STARTED_MSG);

    auto info = channel_->stat(path);
    if (info.is_err()) return Result<void>::Err(info.kind, info.error);
    if (info.value.is_directory) return channel_->rmdir(path);
    return channel_->unlink(path);
}

std::string FileTransfer::format_listing(const std::vector<DirectoryEntry>& entries) {
    if (entries.empty()) return EMPTY_DIR_MARKER;

    std::string out;
    for (const auto& e : entries) {
        if (!out.empty()) out += '\n';
        out += fmt::format("{}  {:>9}  {}{}", format_permissions(e.permissions),
                           e.is_directory ? "-" : format_size(e.size),
                           e.name, e.is_directory ? "/" : "");
    }
    return out;
}
