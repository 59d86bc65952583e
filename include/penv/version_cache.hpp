#pragma once

#include <penv/binary.hpp>
#include <penv/requirement.hpp>
#include <penv/result.hpp>
#include <penv/version.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace penv {

struct CachedBinary {
    Binary binary;
    std::string path;
    std::string sha256;  // digest of the installed file
};

struct CacheEntry {
    Version version;
    std::string root_dir;
    std::vector<CachedBinary> binaries;
    int64_t installed_at = 0;

    const CachedBinary* binary(Binary b) const;
};

// Recompute each binary's digest and compare with the recorded one.
// Checksum error on mismatch, IO error when a file is gone.
Status verify_entry(const CacheEntry& entry);

// Persisted index of installed versions, backed by SQLite. An entry is
// only ever written after its files are in their final place, in a single
// transaction, so the index never references a partial install.
class VersionCache {
public:
    VersionCache();
    ~VersionCache();
    VersionCache(VersionCache&&) noexcept;
    VersionCache& operator=(VersionCache&&) noexcept;

    // versions_dir holds one directory per installed version
    Status open(const std::filesystem::path& db_path,
                const std::filesystem::path& versions_dir);
    void close();
    bool is_open() const;

    const std::filesystem::path& versions_dir() const;
    std::filesystem::path version_dir(const Version& v) const;

    // Installed entries, highest version first, optionally filtered
    Result<std::vector<CacheEntry>> list(const std::optional<Requirement>& req = std::nullopt);
    Result<std::vector<Version>> versions();
    Result<std::optional<CacheEntry>> find(const Version& v);
    Result<bool> is_installed(const Version& v);

    // Append an entry; fails if the version is already indexed
    Status insert(const CacheEntry& entry);

    // Remove the index entry, then the version directory
    Status uninstall(const Version& v);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace penv
