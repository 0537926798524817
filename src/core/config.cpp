#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// Collects parse/validation state while walking the YAML tree.
class ConfigBuilder {
public:
    Result<Config> build(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::PRECONDITION,
                                       "config: top level must be a mapping");
        }

        if (root["terminal"]) {
            const auto& t = root["terminal"];
            config.terminal_.type = t["type"].as<std::string>(config.terminal_.type);
            config.terminal_.cols = t["cols"].as<int>(config.terminal_.cols);
            config.terminal_.rows = t["rows"].as<int>(config.terminal_.rows);
        }

        if (root["timeouts"]) {
            const auto& t = root["timeouts"];
            config.timeouts_.connect = t["connect"].as<int>(config.timeouts_.connect);
            config.timeouts_.exec = t["exec"].as<int>(config.timeouts_.exec);
            config.timeouts_.stream = t["stream"].as<int>(config.timeouts_.stream);
            config.timeouts_.pending_login =
                t["pending_login"].as<int>(config.timeouts_.pending_login);
        }

        if (root["defaults"]) {
            const auto& d = root["defaults"];
            config.defaults_.port = d["port"].as<int>(config.defaults_.port);
            config.defaults_.key_path = d["key_path"].as<std::string>("");
        }

        if (root["transfer"]) {
            config.transfer_.local_dir = root["transfer"]["local_dir"].as<std::string>("");
        }

        if (root["log"]) {
            const auto& l = root["log"];
            config.log_.enabled = l["enabled"].as<bool>(true);
            config.log_.path = l["path"].as<std::string>("");
        }

        auto check = validate(config);
        if (check.is_err()) {
            return Result<Config>::Err(check.kind, check.error);
        }
        return Result<Config>::Ok(config);
    }

private:
    static Result<void> validate(const Config& c) {
        auto positive = [](int v, const char* key) -> Result<void> {
            if (v <= 0) {
                return Result<void>::Err(ErrorKind::PRECONDITION,
                                         std::string("config: ") + key + " must be positive");
            }
            return Result<void>::Ok();
        };

        for (auto r : {positive(c.terminal_.cols, "terminal.cols"),
                       positive(c.terminal_.rows, "terminal.rows"),
                       positive(c.timeouts_.connect, "timeouts.connect"),
                       positive(c.timeouts_.exec, "timeouts.exec"),
                       positive(c.timeouts_.stream, "timeouts.stream"),
                       positive(c.timeouts_.pending_login, "timeouts.pending_login")}) {
            if (r.is_err()) return r;
        }
        if (c.terminal_.type.empty()) {
            return Result<void>::Err(ErrorKind::PRECONDITION,
                                     "config: terminal.type must not be empty");
        }
        if (c.defaults_.port < 1 || c.defaults_.port > 65535) {
            return Result<void>::Err(ErrorKind::PRECONDITION,
                                     "config: defaults.port must be within 1..65535");
        }
        return Result<void>::Ok();
    }
};

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".seacmd";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder().build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::PRECONDITION,
                                   "config: " + std::string(e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }
    try {
        return ConfigBuilder().build(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::PRECONDITION,
                                   "Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}

PtyRequest Config::pty() const {
    PtyRequest req;
    req.term = terminal_.type;
    req.cols = terminal_.cols;
    req.rows = terminal_.rows;
    return req;
}

fs::path Config::resolve_local(const std::string& path) const {
    if (path.empty()) return path;
    if (path[0] == '/' || path[0] == '~') return expand_home(path);
    if (transfer_.local_dir.empty()) return fs::current_path() / path;
    return expand_home(transfer_.local_dir) / path;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::LOCAL_IO,
                                 "Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# seacmd configuration

terminal:
  type: "xterm"       # TERM sent with the pty request
  cols: 80
  rows: 24

timeouts:             # seconds
  connect: 30
  exec: 60            # ssh-exec
  stream: 300         # ssh-run
  pending_login: 120  # how long an 'ssh user@host' waits for ssh-login

defaults:
  port: 22
  key_path: ""        # default key for ssh-login-key

transfer:
  local_dir: ""       # base for relative sftp-get/sftp-put paths (empty = cwd)

log:
  enabled: true
  path: ""            # empty = <tmp>/seacmd_debug.log
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::LOCAL_IO,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err(ErrorKind::LOCAL_IO,
                                 "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}
