#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_default_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_default_config_path() {
    return get_default_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# isojob host configuration

paths:
  jobs_root: "/tmp/isojob/jobs"    # one symlink per active job
  dest_root: "/tmp"                # workspaces are staged at <dest_root>/<name>
  temp_root: "/tmp"                # optional temp dirs are staged at <temp_root>/<name>
  state_dir: "/tmp/isojob/state"   # job records
  log_dir: "/tmp/isojob/logs"

channel:
  name: "env"                      # FIFO inside the registered workspace
  mode: "0600"
  timeout_secs: 30                 # give up if the worker never opens the FIFO

service:
  systemctl: "systemctl"
  unit_template: "playbook@{}.service"
  user: false
  no_block: true
  timeout_secs: 30
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err(ErrorCode::Config,
                                 "Failed to create config file at " + path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorCode::Config,
                                 "Failed to write config file at " + path.string());
    }
    return Result<void>::Ok();
}

static PathsConfig parse_paths_config(const YAML::Node& node) {
    PathsConfig p;
    if (!node) return p;
    p.jobs_root = node["jobs_root"].as<std::string>(p.jobs_root);
    p.dest_root = node["dest_root"].as<std::string>(p.dest_root);
    p.temp_root = node["temp_root"].as<std::string>(p.temp_root);
    p.state_dir = node["state_dir"].as<std::string>(p.state_dir);
    p.log_dir = node["log_dir"].as<std::string>(p.log_dir);
    return p;
}

static ChannelConfig parse_channel_config(const YAML::Node& node) {
    ChannelConfig c;
    if (!node) return c;
    c.name = node["name"].as<std::string>(c.name);
    // Modes are written as octal strings; a bare YAML int like 600 reads the same way
    if (node["mode"] && node["mode"].IsScalar()) {
        c.mode = parse_mode(node["mode"].Scalar(), c.mode);
    }
    c.timeout_secs = node["timeout_secs"].as<int>(c.timeout_secs);
    return c;
}

static ServiceConfig parse_service_config(const YAML::Node& node) {
    ServiceConfig s;
    if (!node) return s;
    s.systemctl = node["systemctl"].as<std::string>(s.systemctl);
    s.unit_template = node["unit_template"].as<std::string>(s.unit_template);
    s.user = node["user"].as<bool>(s.user);
    s.no_block = node["no_block"].as<bool>(s.no_block);
    s.timeout_secs = node["timeout_secs"].as<int>(s.timeout_secs);
    return s;
}

static Result<void> validate(const Config& cfg) {
    const auto& p = cfg.paths();
    for (const auto* path : {&p.jobs_root, &p.dest_root, &p.temp_root, &p.state_dir, &p.log_dir}) {
        if (path->empty() || !fs::path(*path).is_absolute()) {
            return Result<void>::Err(ErrorCode::Config,
                fmt::format("paths must be absolute (got '{}')", *path));
        }
    }

    const auto& ch = cfg.channel();
    if (ch.name.empty() || ch.name.find('/') != std::string::npos ||
        ch.name == "." || ch.name == "..") {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("channel.name must be a plain file name (got '{}')", ch.name));
    }
    if (ch.timeout_secs <= 0 || ch.timeout_secs > MAX_TIMEOUT_SECS) {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("channel.timeout_secs must be between 1 and {}", MAX_TIMEOUT_SECS));
    }

    const auto& svc = cfg.service();
    if (svc.unit_template.find("{}") == std::string::npos) {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("service.unit_template must contain '{{}}' (got '{}')", svc.unit_template));
    }
    try {
        (void)fmt::format(fmt::runtime(svc.unit_template), "probe");
    } catch (const fmt::format_error& e) {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("service.unit_template is not a valid pattern: {}", e.what()));
    }
    if (svc.timeout_secs <= 0 || svc.timeout_secs > MAX_TIMEOUT_SECS) {
        return Result<void>::Err(ErrorCode::Config,
            fmt::format("service.timeout_secs must be between 1 and {}", MAX_TIMEOUT_SECS));
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config cfg;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(ErrorCode::Config, "Config root must be a mapping");
        }
        cfg.paths_ = parse_paths_config(root["paths"]);
        cfg.channel_ = parse_channel_config(root["channel"]);
        cfg.service_ = parse_service_config(root["service"]);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorCode::Config,
                                   "Failed to parse config: " + std::string(e.what()));
    }

    auto valid = validate(cfg);
    if (valid.is_err()) {
        return Result<Config>::Err(valid.code, valid.error);
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorCode::Config, "Cannot read config file: " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse(buf.str());
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
        return result;
    }
    result.value.source_path_ = path;
    return result;
}

Result<Config> Config::load(const std::optional<fs::path>& explicit_path) {
    if (explicit_path) {
        return load_file(*explicit_path);
    }

    const char* env_path = std::getenv(CONFIG_ENV_VAR);
    if (env_path && *env_path) {
        return load_file(env_path);
    }

    fs::path user_path = get_default_config_path();
    if (fs::exists(user_path)) {
        return load_file(user_path);
    }

    return Result<Config>::Ok(Config{});
}

std::string Config::unit_name(const std::string& job_id) const {
    return fmt::format(fmt::runtime(service_.unit_template), job_id);
}
