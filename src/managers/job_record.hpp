#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Persistent per-job record at <state_dir>/<job_id>.yaml. Holds paths and
// lifecycle state only; the secret is never part of it.
class JobRecord {
public:
    // Status values
    static constexpr const char* STAGING  = "staging";
    static constexpr const char* LAUNCHED = "launched";
    static constexpr const char* RUNNING  = "running";
    static constexpr const char* FAILED   = "failed";
    static constexpr const char* CANCELED = "canceled";

    // Fields
    std::string job_id;
    std::string source;
    std::string workspace;
    std::string temp_workspace;      // "" when no temp dir was staged
    bool workspace_created = false;  // false if the workspace pre-existed
    bool temp_created = false;
    std::string registry_path;
    std::string channel_path;
    std::string unit;
    std::string status = STAGING;
    std::string failed_step;
    std::string error;
    std::string submit_time;
    std::string launch_time;
    std::string end_time;

    static Result<JobRecord> load(const fs::path& state_dir, const std::string& job_id);

    // Write via a temp file and rename, so readers never see half a record
    Result<void> save(const fs::path& state_dir) const;

    static Result<void> remove(const fs::path& state_dir, const std::string& job_id);
    static std::vector<JobRecord> list(const fs::path& state_dir);

    static fs::path path_for(const fs::path& state_dir, const std::string& job_id);
};
