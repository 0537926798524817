#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "transport.hpp"

class Session;

// SFTP sub-session. Opened explicitly with start(); every operation needs
// both a usable session and an open SFTP channel.
class FileTransfer {
public:
    explicit FileTransfer(Session& session);
    ~FileTransfer();

    FileTransfer(const FileTransfer&) = delete;
    FileTransfer& operator=(const FileTransfer&) = delete;

    // No-op success when already open.
    Result<std::string> start();

    // Never waits for a transfer in progress.
    bool is_open() const { return open_; }

    // Sorted: directories first, then by name.
    Result<std::vector<DirectoryEntry>> list(const std::string& path);

    Result<uint64_t> upload(const std::filesystem::path& local, const std::string& remote);

    // Writes to "<local>.part" and renames on success; a remote file that
    // cannot be read never touches `local`.
    Result<uint64_t> download(const std::string& remote, const std::filesystem::path& local);

    Result<void> mkdir(const std::string& path);

    // File, or empty directory.
    Result<void> remove(const std::string& path);

    void close();

    // "(empty directory)" for an empty listing.
    static std::string format_listing(const std::vector<DirectoryEntry>& entries);

private:
    friend class Session;

    Session& session_;
    std::mutex mutex_;                  // channel_, held for a whole operation
    std::unique_ptr<SftpChannel> channel_;
    std::atomic<bool> open_{false};

    // Called by Session with op_mutex_ held.
    void attach(std::unique_ptr<SftpChannel> channel);

    // Open channel and usable session, or the error to report.
    Result<void> ready();
};
