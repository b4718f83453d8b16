#include "archive.hpp"
#include <core/constants.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct EntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using WriteArchive = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ReadArchive = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using Entry = std::unique_ptr<struct archive_entry, EntryDeleter>;

std::string archive_err(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

bool is_unsafe_entry_path(const std::string& name) {
    if (name.empty() || name[0] == '/') return true;
    for (const auto& part : fs::path(name)) {
        if (part == "..") return true;
    }
    return false;
}

void write_file_entry(struct archive* a, struct archive_entry* entry,
                      const fs::path& full_path, const std::string& rel,
                      const struct stat& st) {
    archive_entry_clear(entry);
    archive_entry_set_pathname(entry, rel.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(st.st_size));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, st.st_mode & 07777);
    archive_entry_set_mtime(entry, st.st_mtime, 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to write tar header for " + rel + ": " + archive_err(a));
    }

    std::ifstream in(full_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot read " + full_path.string());
    }

    // Write file contents in chunks
    std::vector<char> buf(ARCHIVE_COPY_BUF_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto bytes_read = in.gcount();
        if (bytes_read > 0 &&
            archive_write_data(a, buf.data(), static_cast<size_t>(bytes_read)) < 0) {
            throw std::runtime_error("Failed to write " + rel + " into archive: " + archive_err(a));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error on " + full_path.string());
    }
}

void write_dir_entry(struct archive* a, struct archive_entry* entry,
                     const std::string& rel, const struct stat& st) {
    archive_entry_clear(entry);
    archive_entry_set_pathname(entry, rel.c_str());
    archive_entry_set_filetype(entry, AE_IFDIR);
    archive_entry_set_perm(entry, st.st_mode & 07777);
    archive_entry_set_mtime(entry, st.st_mtime, 0);
    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to write tar header for " + rel + ": " + archive_err(a));
    }
}

} // namespace

size_t create_tar(const fs::path& tar_path, const fs::path& base_dir) {
    if (!fs::is_directory(base_dir)) {
        throw std::runtime_error("Not a directory: " + base_dir.string());
    }

    WriteArchive a(archive_write_new());
    if (!a) throw std::runtime_error("Failed to create archive writer");

    archive_write_set_format_ustar(a.get());

    if (archive_write_open_filename(a.get(), tar_path.string().c_str()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open tar file: " + archive_err(a.get()));
    }

    Entry entry(archive_entry_new());
    size_t files = 0;

    auto it = fs::recursive_directory_iterator(
        base_dir, fs::directory_options::follow_directory_symlink);
    for (const auto& dirent : it) {
        const fs::path& full_path = dirent.path();
        std::string rel = full_path.lexically_relative(base_dir).generic_string();

        // stat() follows symlinks; a dangling link is an error, not a skip
        struct stat st;
        if (stat(full_path.c_str(), &st) != 0) {
            throw std::runtime_error("Cannot stat " + full_path.string() +
                                     " (dangling symlink?)");
        }

        if (S_ISDIR(st.st_mode)) {
            write_dir_entry(a.get(), entry.get(), rel, st);
        } else if (S_ISREG(st.st_mode)) {
            write_file_entry(a.get(), entry.get(), full_path, rel, st);
            files++;
        }
        // Sockets, FIFOs and devices are not part of a workspace
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to finalize tar file: " + archive_err(a.get()));
    }
    return files;
}

size_t extract_tar(const fs::path& tar_path, const fs::path& dest_dir) {
    ReadArchive in(archive_read_new());
    WriteArchive out(archive_write_disk_new());
    if (!in || !out) throw std::runtime_error("Failed to create archive reader");

    archive_read_support_format_tar(in.get());
    archive_read_support_filter_all(in.get());

    // Entry names are rebased onto dest_dir below, so absolute target
    // paths are expected here; unsafe source names are rejected first.
    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    archive_write_disk_set_options(out.get(), flags);
    archive_write_disk_set_standard_lookup(out.get());

    if (archive_read_open_filename(in.get(), tar_path.string().c_str(),
                                   ARCHIVE_BLOCK_SIZE) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open archive " + tar_path.string() +
                                 ": " + archive_err(in.get()));
    }

    fs::create_directories(dest_dir);

    size_t count = 0;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(in.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw std::runtime_error("Corrupt archive " + tar_path.string() +
                                     ": " + archive_err(in.get()));
        }

        std::string name = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        if (is_unsafe_entry_path(name)) {
            throw std::runtime_error("Refusing unsafe archive entry '" + name + "'");
        }
        // Workspace archives carry resolved content only; a link entry could
        // point the next entry outside dest_dir
        if (archive_entry_filetype(entry) == AE_IFLNK || archive_entry_hardlink(entry)) {
            throw std::runtime_error("Refusing link entry '" + name + "' in workspace archive");
        }
        std::string target = (dest_dir / name).string();
        archive_entry_set_pathname(entry, target.c_str());

        if (archive_write_header(out.get(), entry) < ARCHIVE_WARN) {
            throw std::runtime_error("Failed to create " + target + ": " + archive_err(out.get()));
        }

        if (archive_entry_size(entry) > 0) {
            const void* block;
            size_t size;
            la_int64_t offset;
            while ((r = archive_read_data_block(in.get(), &block, &size, &offset)) == ARCHIVE_OK) {
                if (archive_write_data_block(out.get(), block, size, offset) < ARCHIVE_WARN) {
                    throw std::runtime_error("Failed to write " + target + ": " +
                                             archive_err(out.get()));
                }
            }
            if (r != ARCHIVE_EOF) {
                throw std::runtime_error("Truncated archive data for " + name + ": " +
                                         archive_err(in.get()));
            }
        }

        if (archive_write_finish_entry(out.get()) < ARCHIVE_WARN) {
            throw std::runtime_error("Failed to finish " + target + ": " + archive_err(out.get()));
        }
        count++;
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to finalize extraction: " + archive_err(out.get()));
    }
    return count;
}

} // namespace platform
