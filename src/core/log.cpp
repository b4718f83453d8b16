#include "log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

static std::mutex g_log_mutex;
static fs::path g_log_dir;

void set_log_dir(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_dir = dir;
}

fs::path log_dir() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_dir.empty() ? platform::temp_dir() : g_log_dir;
}

std::string isojob_log_path() {
    return (log_dir() / DEBUG_LOG_NAME).string();
}

std::string job_log_path(const std::string& job_id) {
    return (log_dir() / (job_id + ".log")).string();
}

void append_job_log(const std::string& job_id, const std::string& msg) {
    std::string path = job_log_path(job_id);
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

void isojob_log(const std::string& msg) {
    std::string path = isojob_log_path();
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] ",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()))
        << msg << "\n";
}

void isojob_log_cmd(const std::string& label, const std::string& cmd,
                    const CommandResult& r) {
    isojob_log(fmt::format("{} CMD: {}", label, cmd));
    isojob_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        isojob_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
