#include "job_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static constexpr mode_t JOBS_ROOT_MODE = 0700;

JobRegistry::JobRegistry(fs::path jobs_root)
    : root_(std::move(jobs_root)) {
}

fs::path JobRegistry::entry_path(const std::string& job_id) const {
    return root_ / job_id;
}

Result<void> JobRegistry::ensure_root() {
    std::error_code ec;
    fs::create_directories(root_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot create {}: {}", root_.parent_path().string(), ec.message()));
    }

    if (mkdir(root_.c_str(), JOBS_ROOT_MODE) != 0 && errno != EEXIST) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot create jobs root {}: {}", root_.string(), std::strerror(errno)));
    }

    struct stat st;
    if (lstat(root_.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Jobs root {} is not a directory", root_.string()));
    }

    // mkdir honours the umask, and a pre-existing root may be wider
    if ((st.st_mode & 07777) != JOBS_ROOT_MODE && chmod(root_.c_str(), JOBS_ROOT_MODE) != 0) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot restrict {} to 0700: {}", root_.string(), std::strerror(errno)));
    }
    return Result<void>::Ok();
}

Result<fs::path> JobRegistry::register_job(const std::string& job_id, const fs::path& workspace) {
    if (!is_valid_job_id(job_id)) {
        return Result<fs::path>::Err(ErrorCode::Filesystem,
            fmt::format("Invalid job ID '{}'", job_id));
    }

    auto root_ok = ensure_root();
    if (root_ok.is_err()) {
        return Result<fs::path>::Err(root_ok.code, root_ok.error);
    }

    std::error_code ec;
    fs::path target = fs::absolute(workspace, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot resolve workspace {}: {}", workspace.string(), ec.message()));
    }

    fs::path entry = entry_path(job_id);
    if (symlink(target.c_str(), entry.c_str()) != 0) {
        if (errno == EEXIST) {
            return Result<fs::path>::Err(ErrorCode::DuplicateJob,
                fmt::format("Job '{}' is already registered at {}", job_id, entry.string()));
        }
        return Result<fs::path>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot create registry entry {}: {}", entry.string(), std::strerror(errno)));
    }

    isojob_log(fmt::format("registry: {} -> {}", entry.string(), target.string()));
    return Result<fs::path>::Ok(entry);
}

Result<void> JobRegistry::deregister(const std::string& job_id) {
    if (!is_valid_job_id(job_id)) {
        return Result<void>::Err(ErrorCode::Filesystem, fmt::format("Invalid job ID '{}'", job_id));
    }

    fs::path entry = entry_path(job_id);
    struct stat st;
    if (lstat(entry.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return Result<void>::Err(ErrorCode::NotFound,
                fmt::format("Job '{}' is not registered", job_id));
        }
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot inspect {}: {}", entry.string(), std::strerror(errno)));
    }

    // Only ever unlink our own symlinks, never a real directory
    if (!S_ISLNK(st.st_mode)) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("{} is not a registry entry (not a symlink)", entry.string()));
    }

    if (unlink(entry.c_str()) != 0) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot remove {}: {}", entry.string(), std::strerror(errno)));
    }

    isojob_log(fmt::format("registry: removed {}", entry.string()));
    return Result<void>::Ok();
}

bool JobRegistry::contains(const std::string& job_id) const {
    if (!is_valid_job_id(job_id)) return false;
    struct stat st;
    return lstat(entry_path(job_id).c_str(), &st) == 0;
}

Result<fs::path> JobRegistry::lookup(const std::string& job_id) const {
    if (!is_valid_job_id(job_id)) {
        return Result<fs::path>::Err(ErrorCode::Filesystem, fmt::format("Invalid job ID '{}'", job_id));
    }
    std::error_code ec;
    fs::path target = fs::read_symlink(entry_path(job_id), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Result<fs::path>::Err(ErrorCode::NotFound,
                fmt::format("Job '{}' is not registered", job_id));
        }
        return Result<fs::path>::Err(ErrorCode::Filesystem,
            fmt::format("Cannot read registry entry for '{}': {}", job_id, ec.message()));
    }
    return Result<fs::path>::Ok(target);
}

std::vector<RegistryEntry> JobRegistry::list() const {
    std::vector<RegistryEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return entries;

    for (const auto& dirent : fs::directory_iterator(root_, ec)) {
        std::error_code lec;
        if (!dirent.is_symlink(lec)) continue;

        RegistryEntry e;
        e.job_id = dirent.path().filename().string();
        e.target = fs::read_symlink(dirent.path(), lec);
        e.dangling = !fs::exists(dirent.path(), lec);
        entries.push_back(e);
    }

    std::sort(entries.begin(), entries.end(),
              [](const RegistryEntry& a, const RegistryEntry& b) { return a.job_id < b.job_id; });
    return entries;
}

std::optional<std::string> JobRegistry::owner_of(const fs::path& workspace) const {
    std::error_code ec;
    fs::path want = fs::absolute(workspace, ec).lexically_normal();
    if (ec) return std::nullopt;
    for (const auto& e : list()) {
        if (e.target.lexically_normal() == want) return e.job_id;
    }
    return std::nullopt;
}
