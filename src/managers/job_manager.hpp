#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "job_registry.hpp"
#include "workspace_stager.hpp"
#include "service_manager.hpp"

// One row of `isojob list`: a registry entry and/or a job record.
struct JobListing {
    std::string job_id;
    std::string workspace;
    std::string status;       // from the record, "" if there is none
    std::string unit;
    std::string launch_time;
    bool registered = false;
    bool dangling = false;    // registered, but the workspace is gone
    bool active = false;      // worker unit is running
};

// Operations on jobs that already went through launch: cancel, reap, list.
// Safe to run from a different process than the launcher.
class JobManager {
public:
    JobManager(const Config& config, JobRegistry& registry,
               WorkspaceStager& stager, ServiceManager& service);

    // Stop the worker, remove the channel node, deregister, and mark the
    // record canceled. A launcher still waiting on the channel then fails
    // with NoReader and rolls back.
    Result<void> cancel_job(const std::string& job_id, StatusCallback cb = nullptr);

    // Tear down a finished job. Busy while the worker is active unless
    // force (which stops it first). purge also deletes the workspace and
    // staged temp directory.
    Result<void> reap(const std::string& job_id, bool purge, bool force,
                      StatusCallback cb = nullptr);

    std::vector<JobListing> list();

private:
    const Config& config_;
    JobRegistry& registry_;
    WorkspaceStager& stager_;
    ServiceManager& service_;

    Result<void> remove_channel_node(const std::string& job_id);
};
