#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_path_override;
bool log_enabled = true;

std::string default_log_path() {
    return (platform::temp_dir() / "seacmd_debug.log").string();
}

} // namespace

void seacmd_log_configure(const std::string& path, bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path_override = path.empty() ? path : expand_home(path).string();
    log_enabled = enabled;
}

std::string seacmd_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_path_override.empty() ? default_log_path() : log_path_override;
}

void seacmd_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_enabled) return;

    std::string path = log_path_override.empty() ? default_log_path() : log_path_override;
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << now_clock_ms() << "] " << msg << "\n";
}

void seacmd_log_ssh(const std::string& label, const std::string& cmd,
                    const SSHResult& r) {
    seacmd_log(fmt::format("{} CMD: {}", label, cmd));
    seacmd_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        seacmd_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
