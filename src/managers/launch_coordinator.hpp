#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/secret.hpp>
#include "workspace_stager.hpp"
#include "job_registry.hpp"
#include "service_manager.hpp"
#include "job_record.hpp"

namespace fs = std::filesystem;

struct LaunchRequest {
    std::string job_id;
    fs::path source;                      // directory or workspace archive
    std::optional<fs::path> temp_dir;     // staged under temp_root when set
    Secret secret;
};

enum class LaunchStep {
    None,
    StageTemp,
    StageWorkspace,
    Register,
    OpenChannel,
    StartWorker,
    DeliverSecret,
};

const char* launch_step_name(LaunchStep step);

struct LaunchedJob {
    std::string job_id;
    fs::path workspace;
    fs::path registry_path;
    std::string unit;
    std::string started_at;
};

// Runs the launch steps in order: stage temp dir, stage workspace, register,
// open the secret channel, start the worker, deliver the secret. Every
// completed step leaves an undo action; on any failure (or cancel) the undo
// actions run newest-first and the failing step's error is returned.
class LaunchCoordinator {
public:
    LaunchCoordinator(const Config& config, JobRegistry& registry,
                      WorkspaceStager& stager, ServiceManager& service);

    Result<LaunchedJob> launch(const LaunchRequest& request, StatusCallback cb = nullptr);

    // Async-signal-safe. The step in progress fails with Canceled.
    void cancel() { cancel_.store(true); }
    bool canceled() const { return cancel_.load(); }

    LaunchStep failed_step() const { return failed_step_; }

    // Override channel.timeout_secs for the secret rendezvous
    void set_secret_timeout(std::chrono::milliseconds timeout) { secret_timeout_ = timeout; }

private:
    struct Compensation {
        LaunchStep step;
        std::function<Result<void>()> undo;
    };

    const Config& config_;
    JobRegistry& registry_;
    WorkspaceStager& stager_;
    ServiceManager& service_;
    std::atomic<bool> cancel_{false};
    LaunchStep failed_step_ = LaunchStep::None;
    std::chrono::milliseconds secret_timeout_;

    void rollback(std::vector<Compensation>& undo, const std::string& job_id, StatusCallback cb);
};
