#include "job_manager.hpp"
#include "job_record.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>
#include <sys/stat.h>
#include <unistd.h>

JobManager::JobManager(const Config& config, JobRegistry& registry,
                       WorkspaceStager& stager, ServiceManager& service)
    : config_(config), registry_(registry), stager_(stager), service_(service) {
}

// Unlink <entry>/<channel name> if it is a FIFO. Anything else at that
// path belongs to the workspace and is left alone.
Result<void> JobManager::remove_channel_node(const std::string& job_id) {
    fs::path node = registry_.entry_path(job_id) / config_.channel().name;
    struct stat st;
    if (lstat(node.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return Result<void>::Ok();
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot inspect {}: {}", node.string(), std::strerror(errno)));
    }
    if (!S_ISFIFO(st.st_mode)) return Result<void>::Ok();

    if (unlink(node.c_str()) != 0 && errno != ENOENT) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot remove {}: {}", node.string(), std::strerror(errno)));
    }
    isojob_log(fmt::format("manager: removed channel {}", node.string()));
    return Result<void>::Ok();
}

// ── Cancel ─────────────────────────────────────────────────

Result<void> JobManager::cancel_job(const std::string& job_id, StatusCallback cb) {
    if (!is_valid_job_id(job_id) || !registry_.contains(job_id)) {
        return Result<void>::Err(ErrorCode::NotFound,
            fmt::format("Job '{}' is not registered", job_id));
    }

    isojob_log(fmt::format("cancel {}", job_id));
    Result<void> first_error = Result<void>::Ok();
    auto note = [&](const Result<void>& r) {
        if (r.is_ok()) return;
        isojob_log(fmt::format("cancel {}: {}", job_id, r.error));
        if (cb) cb(r.error);
        if (first_error.is_ok()) first_error = r;
    };

    // Mark the record first: a launcher still waiting on the channel reads
    // it while rolling back
    const auto& state_dir = config_.paths().state_dir;
    auto rec = JobRecord::load(state_dir, job_id);
    if (rec.is_ok()) {
        JobRecord record = rec.value;
        record.status = JobRecord::CANCELED;
        record.end_time = now_iso();
        note(record.save(state_dir));
    }

    if (cb) cb(fmt::format("Stopping {}...", service_.unit_for(job_id)));
    note(service_.stop(job_id));
    note(remove_channel_node(job_id));

    auto dereg = registry_.deregister(job_id);
    if (dereg.code != ErrorCode::NotFound) note(dereg);

    append_job_log(job_id, "Job canceled");
    return first_error;
}

// ── Reap ───────────────────────────────────────────────────

Result<void> JobManager::reap(const std::string& job_id, bool purge, bool force, StatusCallback cb) {
    if (!is_valid_job_id(job_id)) {
        return Result<void>::Err(ErrorCode::NotFound, fmt::format("Invalid job ID '{}'", job_id));
    }

    const auto& state_dir = config_.paths().state_dir;
    bool registered = registry_.contains(job_id);
    auto rec = JobRecord::load(state_dir, job_id);
    if (!registered && rec.is_err()) {
        return Result<void>::Err(ErrorCode::NotFound, fmt::format("Job '{}' not found", job_id));
    }

    if (service_.is_active(job_id)) {
        if (!force) {
            return Result<void>::Err(ErrorCode::Busy,
                fmt::format("Job '{}' is still running ({}); use --force to stop it",
                            job_id, service_.unit_for(job_id)));
        }
        if (cb) cb(fmt::format("Stopping {}...", service_.unit_for(job_id)));
        auto stopped = service_.stop(job_id);
        if (stopped.is_err()) return stopped;
    }

    // Workspace paths come from the record, or from the registry entry
    // when the record is gone
    std::string workspace;
    std::string temp_workspace;
    if (rec.is_ok()) {
        workspace = rec.value.workspace;
        temp_workspace = rec.value.temp_workspace;
    } else {
        auto target = registry_.lookup(job_id);
        if (target.is_ok()) workspace = target.value.string();
    }

    if (registered) {
        auto ch = remove_channel_node(job_id);
        if (ch.is_err()) return ch;
        auto dereg = registry_.deregister(job_id);
        if (dereg.is_err() && dereg.code != ErrorCode::NotFound) return dereg;
    }

    if (purge) {
        for (const auto& dir : {workspace, temp_workspace}) {
            if (dir.empty()) continue;
            fs::path p(dir);
            if (!p.is_absolute() || p == p.root_path()) {
                isojob_log(fmt::format("reap {}: refusing to purge '{}'", job_id, dir));
                continue;
            }
            if (cb) cb(fmt::format("Removing {}...", dir));
            StagedTree tree;
            tree.path = p;
            tree.created = true;
            auto removed = stager_.remove(tree);
            if (removed.is_err()) return removed;
        }
    }

    auto removed = JobRecord::remove(state_dir, job_id);
    if (removed.is_err()) return removed;

    append_job_log(job_id, purge ? "Job reaped (purged)" : "Job reaped");
    isojob_log(fmt::format("reap {}: done (purge={}, force={})", job_id, purge, force));
    return Result<void>::Ok();
}

// ── List ───────────────────────────────────────────────────

std::vector<JobListing> JobManager::list() {
    std::map<std::string, JobListing> rows;

    for (const auto& rec : JobRecord::list(config_.paths().state_dir)) {
        JobListing& row = rows[rec.job_id];
        row.job_id = rec.job_id;
        row.workspace = rec.workspace;
        row.status = rec.status;
        row.unit = rec.unit;
        row.launch_time = rec.launch_time;
    }

    for (const auto& entry : registry_.list()) {
        JobListing& row = rows[entry.job_id];
        row.job_id = entry.job_id;
        if (row.workspace.empty()) row.workspace = entry.target.string();
        if (row.unit.empty()) row.unit = service_.unit_for(entry.job_id);
        row.registered = true;
        row.dangling = entry.dangling;
        row.active = service_.is_active(entry.job_id);
    }

    std::vector<JobListing> out;
    out.reserve(rows.size());
    for (auto& kv : rows) out.push_back(kv.second);
    return out;
}
