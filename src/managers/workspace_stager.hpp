#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// A tree placed on this host by WorkspaceStager.
struct StagedTree {
    fs::path path;
    bool created = false;   // false when the destination already existed (re-stage or in place)
    bool in_place = false;  // source and destination are the same directory
};

class WorkspaceStager {
public:
    // Destination for a source under dest_root: the directory's own name,
    // or the archive name without its .tar / .tar.gz / .tgz suffix.
    static fs::path destination_for(const fs::path& source, const fs::path& dest_root);

    // True if source names a workspace archive rather than a directory.
    static bool is_archive(const fs::path& source);

    // Copy a directory tree (following symlinks) or extract a workspace
    // archive to destination_for(source, dest_root). Existing files are
    // overwritten; nothing is rolled back on failure.
    Result<StagedTree> stage(const fs::path& source, const fs::path& dest_root,
                             StatusCallback cb = nullptr);

    // Remove a tree this stager created. Trees that pre-existed, or that
    // were staged in place, are left alone.
    Result<void> remove(const StagedTree& staged);

    // Control-side half: write a workspace archive for later staging.
    // Returns the number of files packed.
    static Result<size_t> pack(const fs::path& source_dir, const fs::path& archive_path);

private:
    Result<void> copy_tree(const fs::path& source, const fs::path& dest);
    Result<void> extract_archive(const fs::path& archive, const fs::path& dest);
};
