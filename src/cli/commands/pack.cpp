#include "../base_cli.hpp"
#include "../theme.hpp"
#include "arg_parser.hpp"
#include <managers/workspace_stager.hpp>
#include <iostream>
#include <fmt/format.h>

static int cmd_pack(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {});
    if (!parsed.error.empty() || parsed.positional.size() != 2) {
        std::cout << theme::fail(parsed.error.empty() ? "Expected <dir> <archive.tar>" : parsed.error);
        cli.print_usage_of("pack");
        return EXIT_USAGE;
    }

    fs::path source = parsed.positional[0];
    fs::path archive = parsed.positional[1];

    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        std::cout << theme::fail(fmt::format("{} is not a directory", source.string()));
        return exit_code_for(ErrorCode::CopyError);
    }

    std::cout << theme::step(fmt::format("Packing {} into {}...", source.string(), archive.string()));
    auto r = WorkspaceStager::pack(source, archive);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return exit_code_for(r.code);
    }

    std::cout << theme::ok(fmt::format("Packed {} files", r.value));
    std::cout << theme::kv("stage as", WorkspaceStager::destination_for(archive, "<dest_root>").string());
    return 0;
}

void register_pack_commands(BaseCLI& cli) {
    cli.add_command("pack", "pack <dir> <archive.tar>",
                    cmd_pack, "Write a workspace archive for 'launch'");
}
