#include "../base_cli.hpp"
#include "../secret_input.hpp"
#include "../theme.hpp"
#include "arg_parser.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/launch_coordinator.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <fmt/format.h>

// ── Signal plumbing ─────────────────────────────────────────

// Coordinator to cancel on SIGINT/SIGTERM while a launch is in flight
static std::atomic<LaunchCoordinator*> g_active_launch{nullptr};

static void on_cancel_signal(int) {
    LaunchCoordinator* c = g_active_launch.load();
    if (c) c->cancel();
}

// Installs the cancel handlers for its lifetime and restores the old ones.
class CancelSignalScope {
public:
    explicit CancelSignalScope(LaunchCoordinator& coordinator) {
        g_active_launch.store(&coordinator);
        struct sigaction sa = {};
        sa.sa_handler = on_cancel_signal;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, &old_int_);
        sigaction(SIGTERM, &sa, &old_term_);
    }

    ~CancelSignalScope() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGTERM, &old_term_, nullptr);
        g_active_launch.store(nullptr);
    }

    CancelSignalScope(const CancelSignalScope&) = delete;
    CancelSignalScope& operator=(const CancelSignalScope&) = delete;

private:
    struct sigaction old_int_;
    struct sigaction old_term_;
};

static StatusCallback progress() {
    return [](const std::string& msg) { std::cout << theme::log(msg) << std::flush; };
}

static int report_error(ErrorCode code, const std::string& msg) {
    std::cout << theme::fail(msg);
    return exit_code_for(code);
}

// ── launch ──────────────────────────────────────────────────

static int cmd_launch(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {"--temp-dir", "--timeout"}, {});
    if (!parsed.error.empty() || parsed.positional.size() != 2) {
        std::cout << theme::fail(parsed.error.empty() ? "Expected <job-id> <source>" : parsed.error);
        cli.print_usage_of("launch");
        return EXIT_USAGE;
    }
    if (!cli.require_config()) return EXIT_USAGE;

    const std::string& job_id = parsed.positional[0];
    if (!is_valid_job_id(job_id)) {
        std::cout << theme::fail(fmt::format("Invalid job ID '{}'", job_id));
        std::cout << theme::step("Use letters, digits, '.', '_' or '-' (not '.' or '..').");
        return EXIT_USAGE;
    }

    if (parsed.options.count("--timeout")) {
        int secs = safe_stoi(parsed.options["--timeout"], -1);
        if (secs <= 0 || secs > MAX_TIMEOUT_SECS) {
            std::cout << theme::fail(fmt::format("--timeout must be between 1 and {} seconds", MAX_TIMEOUT_SECS));
            return EXIT_USAGE;
        }
        cli.config->set_channel_timeout(secs);
    }

    LaunchRequest request;
    request.job_id = job_id;
    request.source = parsed.positional[1];
    if (parsed.options.count("--temp-dir")) {
        request.temp_dir = fs::path(parsed.options["--temp-dir"]);
    }

    auto secret = read_secret_stdin(fmt::format("Secret for job {}: ", job_id));
    if (secret.is_err()) return report_error(secret.code, secret.error);
    if (secret.value.empty()) {
        std::cout << theme::fail("Empty secret; nothing to deliver.");
        return EXIT_USAGE;
    }
    request.secret = std::move(secret.value);

    cli.init_managers();
    LaunchCoordinator coordinator(cli.config.value(), *cli.registry, *cli.stager, *cli.service);

    std::cout << theme::section(fmt::format("Launching {}", job_id));
    Result<LaunchedJob> result = Result<LaunchedJob>::Err(ErrorCode::None, "");
    {
        CancelSignalScope signals(coordinator);
        result = coordinator.launch(request, progress());
    }
    request.secret.clear();

    if (result.is_err()) {
        return report_error(result.code, result.error);
    }

    std::cout << theme::ok(fmt::format("Job {} is running", job_id));
    std::cout << theme::kv("workspace", result.value.workspace.string());
    std::cout << theme::kv("entry", result.value.registry_path.string());
    std::cout << theme::kv("unit", result.value.unit);
    std::cout << "\n";
    return 0;
}

// ── cancel ──────────────────────────────────────────────────

static int cmd_cancel(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {});
    if (!parsed.error.empty() || parsed.positional.size() != 1) {
        std::cout << theme::fail(parsed.error.empty() ? "Expected <job-id>" : parsed.error);
        cli.print_usage_of("cancel");
        return EXIT_USAGE;
    }
    if (!cli.require_config()) return EXIT_USAGE;
    cli.init_managers();

    const std::string& job_id = parsed.positional[0];
    auto r = cli.jobs->cancel_job(job_id, progress());
    if (r.is_err()) return report_error(r.code, r.error);

    std::cout << theme::ok(fmt::format("Job {} canceled", job_id));
    return 0;
}

// ── reap ────────────────────────────────────────────────────

static int cmd_reap(BaseCLI& cli, const std::vector<std::string>& args) {
    auto parsed = parse_args(args, {}, {"--purge", "--force"});
    if (!parsed.error.empty() || parsed.positional.size() != 1) {
        std::cout << theme::fail(parsed.error.empty() ? "Expected <job-id>" : parsed.error);
        cli.print_usage_of("reap");
        return EXIT_USAGE;
    }
    if (!cli.require_config()) return EXIT_USAGE;
    cli.init_managers();

    const std::string& job_id = parsed.positional[0];
    bool purge = parsed.flags.count("--purge") > 0;
    bool force = parsed.flags.count("--force") > 0;

    auto r = cli.jobs->reap(job_id, purge, force, progress());
    if (r.is_err()) return report_error(r.code, r.error);

    std::cout << theme::ok(fmt::format("Job {} reaped{}", job_id, purge ? " and purged" : ""));
    return 0;
}

// ── list ────────────────────────────────────────────────────

static std::string display_status(const JobListing& row) {
    if (row.registered && row.dangling) return "dangling";
    if (row.registered && row.active) return "active";
    if (!row.status.empty()) return row.status;
    return row.registered ? "registered" : "-";
}

static std::string colored_status(const std::string& status) {
    std::string padded = fmt::format("{:<10}", status);
    if (status == "active" || status == "running") return theme::green(padded);
    if (status == "failed" || status == "dangling") return theme::red(padded);
    if (status == "canceled") return theme::yellow(padded);
    return padded;
}

static int cmd_list(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cout << theme::fail("list takes no arguments");
        cli.print_usage_of("list");
        return EXIT_USAGE;
    }
    if (!cli.require_config()) return EXIT_USAGE;
    cli.init_managers();

    auto rows = cli.jobs->list();
    if (rows.empty()) {
        std::cout << theme::dim("    No jobs.") << "\n";
        return 0;
    }

    std::cout << theme::color::DIM
              << fmt::format("    {:<24} {:<10} {:<20} {}", "JOB", "STATUS", "LAUNCHED", "WORKSPACE")
              << theme::color::RESET << "\n";
    for (const auto& row : rows) {
        std::cout << fmt::format("    {:<24} ", row.job_id) << colored_status(display_status(row))
                  << fmt::format(" {:<20} {}", row.launch_time.empty() ? "-" : row.launch_time,
                                 row.workspace)
                  << "\n";
    }
    return 0;
}

void register_jobs_commands(BaseCLI& cli) {
    cli.add_command("launch", "launch <job-id> <source> [--temp-dir DIR] [--timeout SECS]",
                    cmd_launch, "Stage, register and start a job; deliver its secret");
    cli.add_command("cancel", "cancel <job-id>",
                    cmd_cancel, "Stop a job and remove its registration");
    cli.add_command("reap", "reap <job-id> [--purge] [--force]",
                    cmd_reap, "Tear down a finished job");
    cli.add_command("list", "list",
                    cmd_list, "Show registered and recorded jobs");
}
