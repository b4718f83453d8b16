#include "launch_coordinator.hpp"
#include "secret_channel.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

using namespace std::chrono;

const char* launch_step_name(LaunchStep step) {
    switch (step) {
        case LaunchStep::None:           return "none";
        case LaunchStep::StageTemp:      return "stage-temp";
        case LaunchStep::StageWorkspace: return "stage-workspace";
        case LaunchStep::Register:       return "register";
        case LaunchStep::OpenChannel:    return "open-channel";
        case LaunchStep::StartWorker:    return "start-worker";
        case LaunchStep::DeliverSecret:  return "deliver-secret";
    }
    return "unknown";
}

LaunchCoordinator::LaunchCoordinator(const Config& config, JobRegistry& registry,
                                     WorkspaceStager& stager, ServiceManager& service)
    : config_(config), registry_(registry), stager_(stager), service_(service),
      secret_timeout_(seconds(config.channel().timeout_secs)) {
}

void LaunchCoordinator::rollback(std::vector<Compensation>& undo, const std::string& job_id,
                                 StatusCallback cb) {
    if (!undo.empty() && cb) cb("Rolling back...");

    // Keep going on errors; a half rollback is worse than a noisy one
    while (!undo.empty()) {
        Compensation c = std::move(undo.back());
        undo.pop_back();
        auto r = c.undo();
        if (r.is_err()) {
            isojob_log(fmt::format("launch {}: undo {} failed: {}",
                                   job_id, launch_step_name(c.step), r.error));
            if (cb) cb(fmt::format("Undo {} failed: {}", launch_step_name(c.step), r.error));
        } else {
            isojob_log(fmt::format("launch {}: undid {}", job_id, launch_step_name(c.step)));
        }
    }
}

Result<LaunchedJob> LaunchCoordinator::launch(const LaunchRequest& request, StatusCallback cb) {
    const std::string& id = request.job_id;
    const auto& paths = config_.paths();
    failed_step_ = LaunchStep::None;

    if (!is_valid_job_id(id)) {
        return Result<LaunchedJob>::Err(ErrorCode::Filesystem,
            fmt::format("Invalid job ID '{}': use letters, digits, '.', '_' or '-'", id));
    }

    // Cheap early duplicate check so nothing gets staged for a taken ID.
    // The symlink in step 3 remains the real guard.
    if (registry_.contains(id)) {
        failed_step_ = LaunchStep::Register;
        return Result<LaunchedJob>::Err(ErrorCode::DuplicateJob,
            fmt::format("Job '{}' failed at {}: already registered at {}",
                        id, launch_step_name(LaunchStep::Register),
                        registry_.entry_path(id).string()));
    }

    // A staged tree belongs to one job. Refuse before touching anything if
    // another registered job already points at the tree we would stage into.
    auto owned_elsewhere = [&](LaunchStep step, const fs::path& dest) -> Result<LaunchedJob> {
        failed_step_ = step;
        std::string full = fmt::format("Job '{}' failed at {}: {} is in use by another job",
                                       id, launch_step_name(step), dest.string());
        isojob_log(fmt::format("launch {}: {}", id, full));
        return Result<LaunchedJob>::Err(ErrorCode::Filesystem, full);
    };

    fs::path workspace_dest = WorkspaceStager::destination_for(request.source, paths.dest_root);
    if (registry_.owner_of(workspace_dest)) {
        return owned_elsewhere(LaunchStep::StageWorkspace, workspace_dest);
    }
    if (request.temp_dir) {
        fs::path temp_dest = WorkspaceStager::destination_for(*request.temp_dir, paths.temp_root);
        if (registry_.owner_of(temp_dest)) {
            return owned_elsewhere(LaunchStep::StageTemp, temp_dest);
        }
        for (const auto& entry : registry_.list()) {
            auto other = JobRecord::load(paths.state_dir, entry.job_id);
            if (other.is_ok() && !other.value.temp_workspace.empty() &&
                fs::path(other.value.temp_workspace).lexically_normal() == temp_dest.lexically_normal()) {
                return owned_elsewhere(LaunchStep::StageTemp, temp_dest);
            }
        }
    }

    std::vector<Compensation> undo;
    std::optional<SecretChannel> channel;
    JobRecord record;
    bool registered = false;

    record.job_id = id;
    record.source = request.source.string();
    record.submit_time = now_iso();

    // `isojob cancel` from another process marks the record before it
    // tears anything down
    auto canceled_elsewhere = [&]() {
        auto on_disk = JobRecord::load(paths.state_dir, id);
        return on_disk.is_ok() && on_disk.value.status == JobRecord::CANCELED;
    };

    auto fail = [&](LaunchStep step, ErrorCode code, const std::string& msg) {
        failed_step_ = step;
        std::string full = fmt::format("Job '{}' failed at {}: {}", id, launch_step_name(step), msg);
        isojob_log(fmt::format("launch {}: {} ({})", id, full, error_code_name(code)));
        if (registered) append_job_log(id, full);

        rollback(undo, id, cb);

        if (registered) {
            // A cross-process cancel shows up here as NoReader; keep the
            // canceled status it already wrote
            record.status = (code == ErrorCode::Canceled || canceled_elsewhere())
                ? JobRecord::CANCELED : JobRecord::FAILED;
            record.failed_step = launch_step_name(step);
            record.error = msg;
            record.end_time = now_iso();
            auto saved = record.save(paths.state_dir);
            if (saved.is_err()) isojob_log(fmt::format("launch {}: {}", id, saved.error));
        }
        return Result<LaunchedJob>::Err(code, full);
    };

    // Stage a tree. The undo action is pushed before the copy starts so a
    // partially copied new tree is removed too.
    auto stage = [&](LaunchStep step, const fs::path& source, const fs::path& root) -> Result<StagedTree> {
        StagedTree pending;
        pending.path = WorkspaceStager::destination_for(source, root);
        std::error_code ec;
        pending.created = !fs::exists(pending.path, ec);
        undo.push_back({step, [this, pending]() { return stager_.remove(pending); }});

        auto r = stager_.stage(source, root, cb);
        if (r.is_ok()) {
            StagedTree staged = r.value;
            undo.back().undo = [this, staged]() { return stager_.remove(staged); };
        }
        return r;
    };

    isojob_log(fmt::format("launch {}: source={} temp={}", id, request.source.string(),
                           request.temp_dir ? request.temp_dir->string() : "-"));

    // 1. Temp directory
    if (request.temp_dir) {
        if (cancel_.load()) {
            return fail(LaunchStep::StageTemp, ErrorCode::Canceled, "canceled");
        }
        auto t = stage(LaunchStep::StageTemp, *request.temp_dir, paths.temp_root);
        if (t.is_err()) return fail(LaunchStep::StageTemp, t.code, t.error);
        record.temp_workspace = t.value.path.string();
        record.temp_created = t.value.created;
    }

    // 2. Workspace
    if (cancel_.load()) {
        return fail(LaunchStep::StageWorkspace, ErrorCode::Canceled, "canceled");
    }
    auto ws = stage(LaunchStep::StageWorkspace, request.source, paths.dest_root);
    if (ws.is_err()) return fail(LaunchStep::StageWorkspace, ws.code, ws.error);
    StagedTree workspace = ws.value;
    record.workspace = workspace.path.string();
    record.workspace_created = workspace.created;

    // 3. Register
    if (cancel_.load()) {
        return fail(LaunchStep::Register, ErrorCode::Canceled, "canceled");
    }
    auto reg = registry_.register_job(id, workspace.path);
    if (reg.is_err()) return fail(LaunchStep::Register, reg.code, reg.error);
    fs::path registry_path = reg.value;
    undo.push_back({LaunchStep::Register, [this, id]() { return registry_.deregister(id); }});
    registered = true;

    record.registry_path = registry_path.string();
    record.status = JobRecord::STAGING;
    auto saved = record.save(paths.state_dir);
    if (saved.is_err()) return fail(LaunchStep::Register, saved.code, saved.error);
    append_job_log(id, fmt::format("registered {} -> {}", registry_path.string(), workspace.path.string()));
    if (cb) cb(fmt::format("Registered {}", registry_path.string()));

    // 4. Secret channel
    if (cancel_.load()) {
        return fail(LaunchStep::OpenChannel, ErrorCode::Canceled, "canceled");
    }
    fs::path channel_path = registry_path / config_.channel().name;
    auto ch = SecretChannel::create(channel_path, config_.channel().mode);
    if (ch.is_err()) return fail(LaunchStep::OpenChannel, ch.code, ch.error);
    channel.emplace(std::move(ch.value));
    undo.push_back({LaunchStep::OpenChannel, [&channel]() { return channel->close(); }});
    record.channel_path = channel_path.string();
    append_job_log(id, fmt::format("channel {}", channel_path.string()));

    // 5. Worker
    if (cancel_.load()) {
        return fail(LaunchStep::StartWorker, ErrorCode::Canceled, "canceled");
    }
    if (cb) cb(fmt::format("Starting {}...", service_.unit_for(id)));
    if (canceled_elsewhere()) {
        return fail(LaunchStep::StartWorker, ErrorCode::Canceled, "canceled by another process");
    }
    auto worker = service_.start(id);
    if (worker.is_err()) return fail(LaunchStep::StartWorker, worker.code, worker.error);
    undo.push_back({LaunchStep::StartWorker, [this, id]() { return service_.stop(id); }});
    if (canceled_elsewhere()) {
        return fail(LaunchStep::StartWorker, ErrorCode::Canceled, "canceled by another process");
    }

    record.unit = worker.value.unit;
    record.launch_time = worker.value.started_at;
    record.status = JobRecord::LAUNCHED;
    saved = record.save(paths.state_dir);
    if (saved.is_err()) isojob_log(fmt::format("launch {}: {}", id, saved.error));
    append_job_log(id, fmt::format("started {}", worker.value.unit));

    // 6. Secret
    if (cancel_.load()) {
        return fail(LaunchStep::DeliverSecret, ErrorCode::Canceled, "canceled");
    }
    if (cb) cb("Waiting for the worker to open the secret channel...");
    auto delivered = channel->write_once(request.secret, secret_timeout_, &cancel_);
    if (delivered.is_err()) return fail(LaunchStep::DeliverSecret, delivered.code, delivered.error);

    // The worker holds the pipe open; the name is no longer needed
    auto closed = channel->close();
    if (closed.is_err()) isojob_log(fmt::format("launch {}: {}", id, closed.error));

    if (canceled_elsewhere()) {
        return fail(LaunchStep::DeliverSecret, ErrorCode::Canceled, "canceled by another process");
    }
    record.status = JobRecord::RUNNING;
    saved = record.save(paths.state_dir);
    if (saved.is_err()) isojob_log(fmt::format("launch {}: {}", id, saved.error));
    append_job_log(id, fmt::format("secret delivered ({} bytes)", request.secret.size()));

    LaunchedJob job;
    job.job_id = id;
    job.workspace = workspace.path;
    job.registry_path = registry_path;
    job.unit = worker.value.unit;
    job.started_at = worker.value.started_at;
    return Result<LaunchedJob>::Ok(job);
}
