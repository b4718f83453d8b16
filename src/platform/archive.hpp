#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Create a ustar archive at tar_path holding the tree under base_dir.
// Symlinks are followed: the archive carries link targets as regular
// files and directories. Entry names are relative to base_dir.
// Returns the number of regular files written. Throws std::runtime_error.
size_t create_tar(const std::filesystem::path& tar_path,
                  const std::filesystem::path& base_dir);

// Extract tar_path beneath dest_dir (created if missing), preserving
// permissions and mtimes and overwriting existing files. Entries with
// absolute paths or ".." components are rejected before anything is
// written for them. Returns the number of entries extracted.
// Throws std::runtime_error.
size_t extract_tar(const std::filesystem::path& tar_path,
                   const std::filesystem::path& dest_dir);

} // namespace platform
