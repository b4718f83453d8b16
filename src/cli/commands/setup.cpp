#include "../base_cli.hpp"
#include "../theme.hpp"
#include "arg_parser.hpp"
#include <core/config.hpp>
#include <iostream>
#include <fmt/format.h>

static int cmd_init_config(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {});
    if (!parsed.error.empty() || parsed.positional.size() > 1) {
        std::cout << theme::fail(parsed.error.empty() ? "Too many arguments" : parsed.error);
        cli.print_usage_of("init-config");
        return EXIT_USAGE;
    }

    fs::path path = parsed.positional.empty() ? get_default_config_path()
                                              : fs::path(parsed.positional[0]);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::cout << theme::info(fmt::format("{} already exists, left unchanged", path.string()));
        return 0;
    }

    auto r = create_default_config(path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return EXIT_USAGE;
    }
    std::cout << theme::ok(fmt::format("Wrote {}", path.string()));
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init-config", "init-config [PATH]",
                    cmd_init_config, "Write a commented default config");
}
