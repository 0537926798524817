#pragma once

#include <string>
#include <filesystem>

namespace platform {

// HOME, then the passwd entry, then the temp dir.
std::filesystem::path home_dir();

// System temporary directory ("/tmp" when it cannot be determined).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds, resuming after signals.
void sleep_ms(int ms);

} // namespace platform
