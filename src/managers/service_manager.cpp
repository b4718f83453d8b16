#include "service_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>

SystemdServiceManager::SystemdServiceManager(const Config& config)
    : config_(config) {
}

std::string SystemdServiceManager::unit_for(const std::string& job_id) const {
    return config_.unit_name(job_id);
}

CommandResult SystemdServiceManager::systemctl(const std::vector<std::string>& args,
                                               int timeout_secs) {
    const auto& svc = config_.service();
    std::vector<std::string> argv;
    if (svc.user) argv.push_back("--user");
    argv.insert(argv.end(), args.begin(), args.end());

    auto r = platform::run_command(svc.systemctl, argv, timeout_secs * 1000);

    std::string cmd = svc.systemctl;
    for (const auto& a : argv) cmd += " " + a;
    isojob_log_cmd("systemctl", cmd, r);
    return r;
}

Result<WorkerHandle> SystemdServiceManager::start(const std::string& job_id) {
    if (!is_valid_job_id(job_id)) {
        return Result<WorkerHandle>::Err(ErrorCode::Spawn, fmt::format("Invalid job ID '{}'", job_id));
    }

    std::string unit = unit_for(job_id);
    std::vector<std::string> args = {"start"};
    if (config_.service().no_block) args.push_back("--no-block");
    args.push_back(unit);

    auto r = systemctl(args, config_.service().timeout_secs);
    if (r.failed()) {
        std::string detail = r.exit_code < 0 ? "timed out" : r.get_output();
        trim(detail);
        return Result<WorkerHandle>::Err(ErrorCode::Spawn,
            fmt::format("Failed to start {}: {}", unit,
                        detail.empty() ? fmt::format("exit {}", r.exit_code) : detail));
    }

    WorkerHandle handle;
    handle.job_id = job_id;
    handle.unit = unit;
    handle.started_at = now_iso();
    return Result<WorkerHandle>::Ok(handle);
}

Result<void> SystemdServiceManager::stop(const std::string& job_id) {
    std::string unit = unit_for(job_id);
    int timeout = std::max(config_.service().timeout_secs, SERVICE_STOP_TIMEOUT_SECS);

    std::vector<std::string> args = {"stop"};
    if (config_.service().no_block) args.push_back("--no-block");
    args.push_back(unit);

    auto r = systemctl(args, timeout);
    if (r.failed()) {
        std::string detail = r.exit_code < 0 ? "timed out" : r.get_output();
        trim(detail);
        return Result<void>::Err(ErrorCode::Spawn,
            fmt::format("Failed to stop {}: {}", unit,
                        detail.empty() ? fmt::format("exit {}", r.exit_code) : detail));
    }
    return Result<void>::Ok();
}

bool SystemdServiceManager::is_active(const std::string& job_id) {
    auto r = systemctl({"is-active", "--quiet", unit_for(job_id)}, config_.service().timeout_secs);
    return r.success();
}
