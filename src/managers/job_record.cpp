#include "job_record.hpp"
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <unistd.h>

fs::path JobRecord::path_for(const fs::path& state_dir, const std::string& job_id) {
    return state_dir / (job_id + ".yaml");
}

// ── Load ────────────────────────────────────────────────────

Result<JobRecord> JobRecord::load(const fs::path& state_dir, const std::string& job_id) {
    if (!is_valid_job_id(job_id)) {
        return Result<JobRecord>::Err(ErrorCode::NotFound, fmt::format("Invalid job ID '{}'", job_id));
    }

    auto path = path_for(state_dir, job_id);
    if (!fs::exists(path)) {
        return Result<JobRecord>::Err(ErrorCode::NotFound, "Job record not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        JobRecord rec;
        rec.job_id = root["job_id"].as<std::string>(job_id);
        rec.source = root["source"].as<std::string>("");
        rec.workspace = root["workspace"].as<std::string>("");
        rec.temp_workspace = root["temp_workspace"].as<std::string>("");
        rec.workspace_created = root["workspace_created"].as<bool>(false);
        rec.temp_created = root["temp_created"].as<bool>(false);
        rec.registry_path = root["registry_path"].as<std::string>("");
        rec.channel_path = root["channel_path"].as<std::string>("");
        rec.unit = root["unit"].as<std::string>("");
        rec.status = root["status"].as<std::string>(STAGING);
        rec.failed_step = root["failed_step"].as<std::string>("");
        rec.error = root["error"].as<std::string>("");
        rec.submit_time = root["submit_time"].as<std::string>("");
        rec.launch_time = root["launch_time"].as<std::string>("");
        rec.end_time = root["end_time"].as<std::string>("");

        return Result<JobRecord>::Ok(rec);
    } catch (const std::exception& e) {
        return Result<JobRecord>::Err(ErrorCode::Filesystem,
            fmt::format("Failed to load job record {}: {}", path.string(), e.what()));
    }
}

// ── Save ────────────────────────────────────────────────────

Result<void> JobRecord::save(const fs::path& state_dir) const {
    auto path = path_for(state_dir, job_id);

    std::error_code ec;
    fs::create_directories(state_dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot create {}: {}", state_dir.string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "job_id" << YAML::Value << job_id;
    out << YAML::Key << "source" << YAML::Value << source;
    out << YAML::Key << "workspace" << YAML::Value << workspace;
    out << YAML::Key << "temp_workspace" << YAML::Value << temp_workspace;
    out << YAML::Key << "workspace_created" << YAML::Value << workspace_created;
    out << YAML::Key << "temp_created" << YAML::Value << temp_created;
    out << YAML::Key << "registry_path" << YAML::Value << registry_path;
    out << YAML::Key << "channel_path" << YAML::Value << channel_path;
    out << YAML::Key << "unit" << YAML::Value << unit;
    out << YAML::Key << "status" << YAML::Value << status;
    out << YAML::Key << "failed_step" << YAML::Value << failed_step;
    out << YAML::Key << "error" << YAML::Value << error;
    out << YAML::Key << "submit_time" << YAML::Value << submit_time;
    out << YAML::Key << "launch_time" << YAML::Value << launch_time;
    out << YAML::Key << "end_time" << YAML::Value << end_time;
    out << YAML::EndMap;

    auto tmp = path;
    tmp += fmt::format(".tmp.{}", getpid());
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        fout << out.c_str() << "\n";
        fout.close();
        if (!fout) {
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorCode::Filesystem, "Failed to write job record " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── Remove / list ───────────────────────────────────────────

Result<void> JobRecord::remove(const fs::path& state_dir, const std::string& job_id) {
    if (!is_valid_job_id(job_id)) {
        return Result<void>::Err(ErrorCode::NotFound, fmt::format("Invalid job ID '{}'", job_id));
    }
    std::error_code ec;
    fs::remove(path_for(state_dir, job_id), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Failed to remove record for '{}': {}", job_id, ec.message()));
    }
    return Result<void>::Ok();
}

std::vector<JobRecord> JobRecord::list(const fs::path& state_dir) {
    std::vector<JobRecord> records;
    std::error_code ec;
    if (!fs::is_directory(state_dir, ec)) return records;

    for (const auto& entry : fs::directory_iterator(state_dir, ec)) {
        if (entry.path().extension() != ".yaml") continue;
        auto rec = load(state_dir, entry.path().stem().string());
        if (rec.is_ok()) records.push_back(rec.value);
    }

    std::sort(records.begin(), records.end(),
              [](const JobRecord& a, const JobRecord& b) { return a.job_id < b.job_id; });
    return records;
}
