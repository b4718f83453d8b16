#include "workspace_stager.hpp"
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const char* ARCHIVE_SUFFIXES[] = {".tar.gz", ".tgz", ".tar"};

// "/work/42/" and "/work/42" both name the tree "42"
static fs::path normalized(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (n.filename().empty() && n.has_parent_path() && n != n.root_path()) {
        n = n.parent_path();
    }
    return n;
}

bool WorkspaceStager::is_archive(const fs::path& source) {
    std::string name = normalized(source).filename().string();
    for (const char* suffix : ARCHIVE_SUFFIXES) {
        if (ends_with(name, suffix) && name.size() > std::char_traits<char>::length(suffix)) {
            return true;
        }
    }
    return false;
}

fs::path WorkspaceStager::destination_for(const fs::path& source, const fs::path& dest_root) {
    std::string name = normalized(source).filename().string();
    if (is_archive(source)) {
        for (const char* suffix : ARCHIVE_SUFFIXES) {
            if (ends_with(name, suffix)) {
                name.resize(name.size() - std::char_traits<char>::length(suffix));
                break;
            }
        }
    }
    return dest_root / name;
}

// ── Staging ────────────────────────────────────────────────

Result<StagedTree> WorkspaceStager::stage(const fs::path& source, const fs::path& dest_root,
                                          StatusCallback cb) {
    fs::path src = normalized(source);
    if (src.empty() || src == src.root_path() || src.filename() == "." || src.filename() == "..") {
        return Result<StagedTree>::Err(ErrorCode::CopyError,
            fmt::format("Cannot stage '{}': not a named directory or archive", source.string()));
    }

    std::error_code ec;
    if (!fs::exists(src, ec)) {
        return Result<StagedTree>::Err(ErrorCode::CopyError,
            fmt::format("Source '{}' does not exist", src.string()));
    }

    StagedTree staged;
    staged.path = destination_for(src, dest_root);
    staged.created = !fs::exists(staged.path, ec);

    if (!staged.created && fs::equivalent(src, staged.path, ec)) {
        // Already at its destination (the usual case when the control side
        // synced straight into dest_root)
        staged.in_place = true;
        isojob_log(fmt::format("stage: {} already in place", staged.path.string()));
        if (cb) cb(fmt::format("Workspace already in place at {}", staged.path.string()));
        return Result<StagedTree>::Ok(staged);
    }

    Result<void> copied = Result<void>::Ok();
    if (is_archive(src)) {
        if (cb) cb(fmt::format("Extracting {} to {}...", src.filename().string(), staged.path.string()));
        copied = extract_archive(src, staged.path);
    } else if (fs::is_directory(src, ec)) {
        if (cb) cb(fmt::format("Copying {} to {}...", src.string(), staged.path.string()));
        copied = copy_tree(src, staged.path);
    } else {
        copied = Result<void>::Err(ErrorCode::CopyError,
            fmt::format("Source '{}' is neither a directory nor a workspace archive", src.string()));
    }

    if (copied.is_err()) {
        isojob_log(fmt::format("stage: {} -> {} failed: {}",
                               src.string(), staged.path.string(), copied.error));
        return Result<StagedTree>::Err(copied.code, copied.error);
    }

    isojob_log(fmt::format("stage: {} -> {} ({})", src.string(), staged.path.string(),
                           staged.created ? "new" : "overwrote"));
    return Result<StagedTree>::Ok(staged);
}

Result<void> WorkspaceStager::copy_tree(const fs::path& source, const fs::path& dest) {
    // Without copy_symlinks/skip_symlinks, fs::copy follows links: their
    // targets are copied as content, matching a copy-links sync.
    auto opts = fs::copy_options::recursive | fs::copy_options::overwrite_existing;
    try {
        fs::create_directories(dest.parent_path());
        fs::copy(source, dest, opts);
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(ErrorCode::CopyError,
            fmt::format("Copy {} -> {} failed: {}", source.string(), dest.string(), e.what()));
    }
    return Result<void>::Ok();
}

Result<void> WorkspaceStager::extract_archive(const fs::path& archive, const fs::path& dest) {
    try {
        size_t n = platform::extract_tar(archive, dest);
        isojob_log(fmt::format("stage: extracted {} entries from {}", n, archive.string()));
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::CopyError,
            fmt::format("Extract {} -> {} failed: {}", archive.string(), dest.string(), e.what()));
    }
    return Result<void>::Ok();
}

// ── Cleanup ────────────────────────────────────────────────

Result<void> WorkspaceStager::remove(const StagedTree& staged) {
    if (!staged.created || staged.in_place || staged.path.empty()) {
        return Result<void>::Ok();
    }
    std::error_code ec;
    fs::remove_all(staged.path, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::Filesystem,
            fmt::format("Failed to remove {}: {}", staged.path.string(), ec.message()));
    }
    isojob_log(fmt::format("stage: removed {}", staged.path.string()));
    return Result<void>::Ok();
}

// ── Pack ───────────────────────────────────────────────────

Result<size_t> WorkspaceStager::pack(const fs::path& source_dir, const fs::path& archive_path) {
    if (!is_archive(archive_path) || ends_with(archive_path.string(), ".gz") ||
        ends_with(archive_path.string(), ".tgz")) {
        return Result<size_t>::Err(ErrorCode::CopyError,
            fmt::format("Archive name must end in .tar (got '{}')", archive_path.string()));
    }
    try {
        size_t files = platform::create_tar(archive_path, source_dir);
        isojob_log(fmt::format("pack: {} -> {} ({} files)",
                               source_dir.string(), archive_path.string(), files));
        return Result<size_t>::Ok(files);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(archive_path, ec);
        return Result<size_t>::Err(ErrorCode::CopyError,
            fmt::format("Pack {} failed: {}", source_dir.string(), e.what()));
    }
}
