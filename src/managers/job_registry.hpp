#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct RegistryEntry {
    std::string job_id;
    fs::path target;        // workspace the entry points at
    bool dangling = false;  // target no longer exists
};

// Filesystem-backed index of active jobs: <jobs_root>/<job_id> is a
// symlink to the job's staged workspace. The jobs root is private to the
// executing user (mode 0700). Registration is one symlink(2) call, so two
// launchers racing on the same job ID cannot both win.
class JobRegistry {
public:
    explicit JobRegistry(fs::path jobs_root);

    const fs::path& root() const { return root_; }
    fs::path entry_path(const std::string& job_id) const;

    // Create the jobs root if absent and restrict it to 0700.
    Result<void> ensure_root();

    // Returns the registry path. DuplicateJob if any entry (live or
    // dangling) already exists under that ID; the existing entry is untouched.
    Result<fs::path> register_job(const std::string& job_id, const fs::path& workspace);

    // Remove the symlink only; the workspace is never touched.
    Result<void> deregister(const std::string& job_id);

    bool contains(const std::string& job_id) const;
    Result<fs::path> lookup(const std::string& job_id) const;
    std::vector<RegistryEntry> list() const;

    // ID of the entry (live or dangling) whose target is workspace, if any
    std::optional<std::string> owner_of(const fs::path& workspace) const;

private:
    fs::path root_;
};
