#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/job_registry.hpp>
#include <managers/workspace_stager.hpp>
#include <managers/service_manager.hpp>
#include <managers/job_manager.hpp>

// Process exit status for each error kind
int exit_code_for(ErrorCode code);

constexpr int EXIT_USAGE = 1;

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    // Returns the process exit status
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     const std::string& usage,
                     CommandHandler handler,
                     const std::string& help);

    // Load config (see Config::load) and point the loggers at its log_dir.
    // Prints the error and returns false on failure.
    bool load_config(const std::optional<std::filesystem::path>& path);

    bool require_config();
    void init_managers();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;

    // Shown as "usage: isojob <usage>" after a usage error
    void print_usage_of(const std::string& command) const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<JobRegistry> registry;
    std::unique_ptr<WorkspaceStager> stager;
    std::unique_ptr<ServiceManager> service;
    std::unique_ptr<JobManager> jobs;

protected:
    struct Command {
        std::string usage;
        CommandHandler handler;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
