#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_jobs_commands(BaseCLI& cli);
void register_pack_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class IsojobCLI : public BaseCLI {
public:
    IsojobCLI();

    // Entry point for argv after the program name. Handles the global
    // options (--config, --version, --help) and dispatches the command.
    int run(const std::vector<std::string>& argv);

    void print_usage() const;

private:
    void register_all_commands();
};
