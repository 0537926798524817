#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <filesystem>

// Wall-clock time of day with milliseconds (HH:MM:SS.mmm), used by the log.
std::string now_clock_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict port parse: digits only, 1..65535. Returns -1 when invalid.
int parse_port(const std::string& s);

// Split on runs of spaces. Empty pieces are dropped; no quoting.
std::vector<std::string> split_words(const std::string& s);

// Join with a single separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep = " ");

std::string to_lower(std::string s);

// Overwrite the characters of a secret before releasing it.
void wipe(std::string& secret);

// Expand a leading "~" to the home directory.
std::filesystem::path expand_home(const std::string& path);

// Render POSIX mode bits as "drwxr-xr-x".
std::string format_permissions(uint32_t mode);

// Human-friendly byte count ("512 B", "1.5 KB", "3.2 MB").
std::string format_size(uint64_t bytes);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
