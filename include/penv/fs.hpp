#pragma once

#include <penv/result.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace penv {

namespace fs = std::filesystem;

// Write via temp file + fsync + rename + fsync(dir). Readers see either the
// old content or the new content, never a truncated file.
Status write_file_atomic(const fs::path& path, const std::string& content);

Result<std::string> read_file(const fs::path& path);

// Repoint (or create) a symlink by renaming a freshly created temp link
// over it.
Status replace_symlink(const fs::path& link, const fs::path& target);

// Create <parent>/<prefix>-<pid>-<random hex>, unique across processes.
Result<fs::path> make_unique_dir(const fs::path& parent, const std::string& prefix);

Status ensure_dir(const fs::path& dir);
Status remove_tree(const fs::path& path);

// n random lowercase hex characters from /dev/urandom
std::string random_hex(size_t n);

int64_t unix_now();

// Exclusive advisory lock (flock) on a lock file, released on destruction.
// Two FileLocks on the same path conflict even within one process.
class FileLock {
public:
    static Result<FileLock> acquire(const fs::path& path);

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

    const fs::path& path() const { return path_; }

private:
    FileLock(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    void release();

    int fd_ = -1;
    fs::path path_;
};

} // namespace penv
