#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    // Daemons and sudo -i may run without HOME
    struct passwd* pw = getpwuid(geteuid());
    if (pw && pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : dir;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    struct timespec req;
    req.tv_sec = ms / 1000;
    req.tv_nsec = static_cast<long>(ms % 1000) * 1000000L;
    // SIGWINCH interrupts the sleep; finish the remainder.
    while (nanosleep(&req, &req) == -1 && errno == EINTR) {
    }
}

} // namespace platform
