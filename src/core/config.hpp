#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load config from an explicit path. A missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text (used by load_file and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Resolve the config location: explicit path, then $ISOJOB_CONFIG,
    // then ~/.isojob/config.yaml. Falls back to built-in defaults when
    // none of those exist.
    static Result<Config> load(const std::optional<fs::path>& explicit_path = std::nullopt);

    // Accessors
    const PathsConfig& paths() const { return paths_; }
    const ChannelConfig& channel() const { return channel_; }
    const ServiceConfig& service() const { return service_; }
    const fs::path& source_path() const { return source_path_; }

    // Systemd unit for a job: unit_template with the job ID substituted
    std::string unit_name(const std::string& job_id) const;

    // Overrides applied from the command line
    void set_channel_timeout(int secs) { channel_.timeout_secs = secs; }

public:
    Config() = default;

private:
    PathsConfig paths_;
    ChannelConfig channel_;
    ServiceConfig service_;
    fs::path source_path_;  // empty when running on built-in defaults
};

// Get paths
fs::path get_default_config_dir();
fs::path get_default_config_path();

// Create a commented default config file; does not overwrite an existing one
Result<void> create_default_config(const fs::path& path = get_default_config_path());
