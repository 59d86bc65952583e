#pragma once

#include <penv/result.hpp>
#include <filesystem>

namespace penv {

// Extract a (possibly compressed) tar archive into dest_dir with libarchive.
// Entries with absolute paths, ".." components or that would write through a
// symlink are rejected.
Status extract_archive(const std::filesystem::path& archive,
                       const std::filesystem::path& dest_dir);

} // namespace penv
