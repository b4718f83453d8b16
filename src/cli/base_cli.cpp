#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:          return 0;
        case ErrorCode::Config:        return EXIT_USAGE;
        case ErrorCode::CopyError:     return 2;
        case ErrorCode::DuplicateJob:  return 3;
        case ErrorCode::Filesystem:    return 4;
        case ErrorCode::Spawn:         return 5;
        case ErrorCode::Timeout:       return 6;
        case ErrorCode::NoReader:      return 7;
        case ErrorCode::ChannelExists: return 8;
        case ErrorCode::Canceled:      return 9;
        case ErrorCode::NotFound:      return 10;
        case ErrorCode::Busy:          return 11;
    }
    return EXIT_USAGE;
}

void BaseCLI::add_command(const std::string& name,
                          const std::string& usage,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {usage, handler, help};
}

bool BaseCLI::load_config(const std::optional<std::filesystem::path>& path) {
    auto config_result = Config::load(path);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return false;
    }
    config = config_result.value;
    set_log_dir(config->paths().log_dir);
    return true;
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("No configuration loaded.");
        return false;
    }
    return true;
}

void BaseCLI::init_managers() {
    if (!config || jobs) return;
    registry = std::make_unique<JobRegistry>(config->paths().jobs_root);
    stager = std::make_unique<WorkspaceStager>();
    service = std::make_unique<SystemdServiceManager>(config.value());
    jobs = std::make_unique<JobManager>(config.value(), *registry, *stager, *service);
}

bool BaseCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'isojob --help' for available commands.");
        return EXIT_USAGE;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        isojob_log(fmt::format("{}: unhandled exception: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_USAGE;
    }
}

void BaseCLI::print_usage_of(const std::string& command) const {
    auto it = commands_.find(command);
    if (it == commands_.end()) return;
    std::cout << theme::step("Usage: isojob " + it->second.usage);
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Jobs",      {"launch", "cancel", "reap", "list"}},
        {"Workspace", {"pack"}},
        {"Setup",     {"init-config"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<52}", it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}
