#pragma once

#include <string>
#include <core/types.hpp>
#include <core/config.hpp>

struct WorkerHandle {
    std::string job_id;
    std::string unit;
    std::string started_at;
};

// Starts and stops the per-job worker under a host process manager.
class ServiceManager {
public:
    virtual ~ServiceManager() = default;

    // Request a start. Success means the manager accepted the request, not
    // that the worker is ready.
    virtual Result<WorkerHandle> start(const std::string& job_id) = 0;
    virtual Result<void> stop(const std::string& job_id) = 0;
    virtual bool is_active(const std::string& job_id) = 0;
    virtual std::string unit_for(const std::string& job_id) const = 0;
};

// ServiceManager backed by systemd template units, e.g. playbook@<id>.service.
class SystemdServiceManager : public ServiceManager {
public:
    explicit SystemdServiceManager(const Config& config);

    Result<WorkerHandle> start(const std::string& job_id) override;
    Result<void> stop(const std::string& job_id) override;
    bool is_active(const std::string& job_id) override;
    std::string unit_for(const std::string& job_id) const override;

private:
    const Config& config_;

    CommandResult systemctl(const std::vector<std::string>& args, int timeout_secs);
};
