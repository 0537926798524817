#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

std::string now_clock_ms() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

int parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5) return -1;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        return -1;
    int port = safe_stoi(s, -1);
    if (port < 1 || port > 65535) return -1;
    return port;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < s.size()) {
        auto start = s.find_first_not_of(' ', pos);
        if (start == std::string::npos) break;
        auto end = s.find(' ', start);
        if (end == std::string::npos) end = s.size();
        out.push_back(s.substr(start, end - start));
        pos = end;
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void wipe(std::string& secret) {
    volatile char* p = secret.empty() ? nullptr : &secret[0];
    for (size_t i = 0; i < secret.size(); i++) p[i] = '\0';
    secret.clear();
    secret.shrink_to_fit();
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return std::filesystem::path(path);
}

std::string format_permissions(uint32_t mode) {
    std::string out(10, '-');
    switch (mode & 0170000) {
        case 0040000: out[0] = 'd'; break;
        case 0120000: out[0] = 'l'; break;
        default: break;
    }
    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; i++) {
        if (mode & (0400 >> i)) out[i + 1] = rwx[i];
    }
    return out;
}

std::string format_size(uint64_t bytes) {
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double kb = bytes / 1024.0;
    if (kb < 1024.0) return fmt::format("{:.1f} KB", kb);
    double mb = kb / 1024.0;
    if (mb < 1024.0) return fmt::format("{:.1f} MB", mb);
    return fmt::format("{:.1f} GB", mb / 1024.0);
}
