#pragma once

#include <penv/home.hpp>
#include <penv/release.hpp>
#include <penv/result.hpp>
#include <penv/version_cache.hpp>

#include <filesystem>
#include <vector>

namespace penv {

// Two-phase install of one version: files are staged in a process-unique
// directory, verified as a whole, then committed by a directory rename
// plus an index insert. Destroying an uncommitted transaction aborts it
// and removes the staging directory.
//
//   Staging --mark_verified--> Verified --commit--> Committed
//      \                          \
//       `------- abort() ---------`----> Aborted
class InstallTransaction {
public:
    enum class State { Staging, Verified, Committed, Aborted };

    static Result<InstallTransaction> begin(const std::filesystem::path& staging_root,
                                            const Version& version);

    InstallTransaction(InstallTransaction&& other) noexcept;
    InstallTransaction& operator=(InstallTransaction&& other) = delete;
    InstallTransaction(const InstallTransaction&) = delete;
    InstallTransaction& operator=(const InstallTransaction&) = delete;
    ~InstallTransaction();

    State state() const { return state_; }
    const Version& version() const { return version_; }

    // Scratch space for downloads and extraction
    std::filesystem::path work_dir() const { return dir_ / "work"; }
    // Final binaries go here; becomes <versions>/<v>/bin on commit
    std::filesystem::path bin_dir() const { return dir_ / "payload" / "bin"; }

    // Record a binary placed in bin_dir() with the digest of that file
    void add(Binary b, std::string sha256);

    // Every binary in `required` must have been added
    Status mark_verified(const std::vector<Binary>& required);

    Result<CacheEntry> commit(VersionCache& cache);
    void abort();

private:
    InstallTransaction(std::filesystem::path dir, Version version)
        : dir_(std::move(dir)), version_(std::move(version)) {}

    std::filesystem::path dir_;
    Version version_;
    std::vector<CachedBinary> staged_;
    State state_ = State::Staging;
};

const char* to_string(InstallTransaction::State s);

// Installs releases into the Version Cache
class Installer {
public:
    Installer(const Home& home, VersionCache& cache, ReleaseSource& source)
        : home_(home), cache_(cache), source_(source) {}

    // Idempotent: an installed, intact version is returned without any
    // network access. Concurrent installs of one version serialize on a
    // per-version lock file.
    Result<CacheEntry> install(const Release& release);

private:
    // With `repair`, an entry failing verification is uninstalled
    Result<std::optional<CacheEntry>> existing_intact(const Version& v, bool repair);
    Status stage_binary(const ReleaseAsset& asset, const std::filesystem::path& work_dir,
                        const std::filesystem::path& bin_dir, std::string& digest_out);

    Home home_;
    VersionCache& cache_;
    ReleaseSource& source_;
};

} // namespace penv
