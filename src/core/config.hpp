#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.seacmd/config.yaml. A missing file yields the defaults.
    static Result<Config> load(const fs::path& path);
    static Result<Config> load();

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const TerminalSettings& terminal() const { return terminal_; }
    const TimeoutSettings& timeouts() const { return timeouts_; }
    const ConnectionDefaults& defaults() const { return defaults_; }
    const TransferSettings& transfer() const { return transfer_; }
    const LogSettings& log() const { return log_; }

    PtyRequest pty() const;

    // Resolve a local path for transfers: absolute and "~" paths are used
    // as-is, relative ones are placed under transfer.local_dir.
    fs::path resolve_local(const std::string& path) const;

public:
    Config() = default;

private:
    TerminalSettings terminal_;
    TimeoutSettings timeouts_;
    ConnectionDefaults defaults_;
    TransferSettings transfer_;
    LogSettings log_;

    friend class ConfigBuilder;
};

bool config_exists();

fs::path get_config_dir();
fs::path get_config_path();

// Create ~/.seacmd/config.yaml with commented defaults (never overwrites).
Result<void> create_default_config();
