#pragma once

#include <string>
#include <core/types.hpp>

// Debug log, appended to a plain text file. Safe to call from any thread.
// Never pass secrets in.

// Redirect the log (empty path restores <tmp>/seacmd_debug.log).
void seacmd_log_configure(const std::string& path, bool enabled);

std::string seacmd_log_path();

void seacmd_log(const std::string& msg);

// Log a remote command and its outcome, truncating long output.
void seacmd_log_ssh(const std::string& label, const std::string& cmd,
                    const SSHResult& r);
