#include "isojob_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <optional>
#include <filesystem>

IsojobCLI::IsojobCLI() : BaseCLI() {
    register_all_commands();
}

void IsojobCLI::register_all_commands() {
    register_jobs_commands(*this);
    register_pack_commands(*this);
    register_setup_commands(*this);
}

void IsojobCLI::print_usage() const {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    isojob "
              << theme::color::RESET << theme::color::BROWN << "[--config PATH] <command> [args]"
              << theme::color::RESET << "\n";
    print_help();
    std::cout << theme::color::DIM
              << "    isojob --version        Show version\n"
              << "    isojob --help           Show this help\n\n"
              << "    The secret for 'launch' is read from the terminal (echo off)\n"
              << "    or, when stdin is not a terminal, from stdin until EOF."
              << theme::color::RESET << "\n\n";
}

int IsojobCLI::run(const std::vector<std::string>& argv) {
    std::optional<std::filesystem::path> config_path;
    size_t i = 0;

    // Global options come before the command
    while (i < argv.size() && argv[i].size() > 1 && argv[i][0] == '-') {
        const std::string& opt = argv[i];
        if (opt == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "isojob"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << ISOJOB_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (opt == "--help" || opt == "-h") {
            print_usage();
            return 0;
        } else if (opt == "--config") {
            if (i + 1 >= argv.size()) {
                std::cout << theme::fail("--config requires a path");
                return EXIT_USAGE;
            }
            config_path = argv[i + 1];
            i += 2;
        } else {
            std::cout << theme::fail("Unknown option: " + opt);
            print_usage();
            return EXIT_USAGE;
        }
    }

    if (i >= argv.size()) {
        print_usage();
        return EXIT_USAGE;
    }

    std::string cmd = argv[i];
    std::vector<std::string> args(argv.begin() + i + 1, argv.end());

    if (!has_command(cmd)) {
        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_USAGE;
    }

    if (!load_config(config_path)) {
        return EXIT_USAGE;
    }
    return execute_command(cmd, args);
}
