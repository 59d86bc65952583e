#include <penv/installer.hpp>
#include <penv/archive.hpp>
#include <penv/fs.hpp>
#include <penv/log.hpp>
#include <penv/sha256.hpp>

#include <algorithm>
#include <future>

namespace penv {

const char* to_string(InstallTransaction::State s) {
    switch (s) {
        case InstallTransaction::State::Staging:   return "staging";
        case InstallTransaction::State::Verified:  return "verified";
        case InstallTransaction::State::Committed: return "committed";
        case InstallTransaction::State::Aborted:   return "aborted";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// InstallTransaction
// ---------------------------------------------------------------------------

Result<InstallTransaction> InstallTransaction::begin(const std::filesystem::path& staging_root,
                                                     const Version& version) {
    auto dir = make_unique_dir(staging_root, version.to_string());
    if (dir.is_err()) return std::move(dir).error();

    InstallTransaction tx(std::move(dir).value(), version);
    PENV_TRY(ensure_dir(tx.work_dir()));
    PENV_TRY(ensure_dir(tx.bin_dir()));
    log::debug("staging %s in %s", version.to_string().c_str(), tx.dir_.c_str());
    return Result<InstallTransaction>::ok(std::move(tx));
}

InstallTransaction::InstallTransaction(InstallTransaction&& other) noexcept
    : dir_(std::move(other.dir_)),
      version_(std::move(other.version_)),
      staged_(std::move(other.staged_)),
      state_(other.state_) {
    // The moved-from object must not clean up the directory it no longer owns
    other.state_ = State::Committed;
}

InstallTransaction::~InstallTransaction() {
    if (state_ == State::Staging || state_ == State::Verified) {
        abort();
    }
}

void InstallTransaction::add(Binary b, std::string sha256) {
    staged_.push_back(CachedBinary{b, (bin_dir() / binary_name(b)).string(), std::move(sha256)});
}

Status InstallTransaction::mark_verified(const std::vector<Binary>& required) {
    if (state_ != State::Staging) {
        return PenvError{PenvError::InvalidArg,
            std::string("cannot verify an install that is ") + to_string(state_)};
    }
    for (Binary b : required) {
        auto it = std::find_if(staged_.begin(), staged_.end(),
                               [&](const CachedBinary& cb) { return cb.binary == b; });
        if (it == staged_.end()) {
            return PenvError{PenvError::NotFound,
                std::string(binary_name(b)) + " was not staged for " + version_.to_string()};
        }
    }
    state_ = State::Verified;
    return ok_status();
}

Result<CacheEntry> InstallTransaction::commit(VersionCache& cache) {
    if (state_ != State::Verified) {
        return PenvError{PenvError::InvalidArg,
            std::string("cannot commit an install that is ") + to_string(state_)};
    }

    std::filesystem::path final_dir = cache.version_dir(version_);

    // Caller holds the version lock and the index has no entry, so anything
    // at final_dir is debris from an interrupted uninstall.
    std::error_code ec;
    if (std::filesystem::exists(final_dir, ec)) {
        log::warn("removing orphaned directory %s", final_dir.c_str());
        PENV_TRY(remove_tree(final_dir));
    }

    std::filesystem::rename(dir_ / "payload", final_dir, ec);
    if (ec) {
        abort();
        return PenvError{PenvError::IO,
            "cannot move staged " + version_.to_string() + " into the cache: " + ec.message()};
    }

    CacheEntry entry;
    entry.version = version_;
    entry.root_dir = final_dir.string();
    entry.installed_at = unix_now();
    for (const auto& cb : staged_) {
        entry.binaries.push_back(CachedBinary{
            cb.binary, (final_dir / "bin" / binary_name(cb.binary)).string(), cb.sha256});
    }

    auto inserted = cache.insert(entry);
    if (inserted.is_err()) {
        auto removed = remove_tree(final_dir);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        abort();
        return std::move(inserted).error();
    }

    state_ = State::Committed;
    auto cleaned = remove_tree(dir_);
    if (cleaned.is_err()) log::warn("%s", cleaned.error().message.c_str());
    return Result<CacheEntry>::ok(std::move(entry));
}

void InstallTransaction::abort() {
    if (state_ == State::Committed || state_ == State::Aborted) return;
    state_ = State::Aborted;
    auto removed = remove_tree(dir_);
    if (removed.is_err()) {
        log::warn("%s", removed.error().message.c_str());
    }
    log::debug("aborted install of %s", version_.to_string().c_str());
}

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

Result<std::optional<CacheEntry>> Installer::existing_intact(const Version& v, bool repair) {
    auto found = cache_.find(v);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) return found;

    auto verified = verify_entry(*found.value());
    if (verified.is_ok()) return found;

    if (repair) {
        log::warn("%s; reinstalling", verified.error().message.c_str());
        PENV_TRY(cache_.uninstall(v));
    }
    return Result<std::optional<CacheEntry>>::ok(std::nullopt);
}

static Result<std::filesystem::path> find_file_named(const std::filesystem::path& root,
                                                     const std::string& name) {
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->path().filename() == name && it->is_regular_file(ec)) {
            return Result<std::filesystem::path>::ok(it->path());
        }
    }
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot scan " + root.string() + ": " + ec.message()};
    }
    return PenvError{PenvError::NotFound, "archive does not contain '" + name + "'"};
}

Status Installer::stage_binary(const ReleaseAsset& asset, const std::filesystem::path& work_dir,
                               const std::filesystem::path& bin_dir, std::string& digest_out) {
    const std::string name = binary_name(asset.binary);
    const std::filesystem::path dir = work_dir / name;
    PENV_TRY(ensure_dir(dir));

    const auto checksum_file = dir / (name + ".tar.gz.sha256");
    const auto archive = dir / (name + ".tar.gz");

    log::info("downloading %s", asset.archive_url.c_str());
    PENV_TRY(source_.fetch(asset.checksum_url, checksum_file));
    PENV_TRY(source_.fetch(asset.archive_url, archive));

    auto published = read_file(checksum_file);
    if (published.is_err()) return std::move(published).error();
    auto expected = parse_checksum_file(published.value());
    if (expected.is_err()) {
        return expected.error().context(asset.checksum_url);
    }

    auto actual = Sha256::hash_file(archive);
    if (actual.is_err()) return std::move(actual).error();
    if (actual.value() != expected.value()) {
        return PenvError{PenvError::Checksum,
            "checksum mismatch for " + asset.archive_url,
            "expected " + expected.value() + ", downloaded " + actual.value()};
    }

    const auto extract_dir = dir / "extract";
    PENV_TRY(ensure_dir(extract_dir));
    PENV_TRY(extract_archive(archive, extract_dir));

    auto extracted = find_file_named(extract_dir, name);
    if (extracted.is_err()) return extracted.error().context(asset.archive_url);

    const auto dest = bin_dir / name;
    std::error_code ec;
    std::filesystem::rename(extracted.value(), dest, ec);
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot stage " + name + ": " + ec.message()};
    }
    std::filesystem::permissions(dest,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
        std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
        std::filesystem::perms::others_exec, ec);
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot mark " + name + " executable: " + ec.message()};
    }

    auto digest = Sha256::hash_file(dest);
    if (digest.is_err()) return std::move(digest).error();
    digest_out = std::move(digest).value();
    log::debug("verified %s %s", name.c_str(), actual.value().c_str());
    return ok_status();
}

Result<CacheEntry> Installer::install(const Release& release) {
    const Version& v = release.version;
    const std::string ver = v.to_string();

    {
        auto existing = existing_intact(v, false);
        if (existing.is_err()) return std::move(existing).error();
        if (existing.value()) {
            log::info("%s is already installed", ver.c_str());
            return Result<CacheEntry>::ok(std::move(*existing.value()));
        }
    }

    auto lock = FileLock::acquire(home_.install_lock(ver));
    if (lock.is_err()) return std::move(lock).error();

    // Another process may have finished the same install while we waited
    {
        auto existing = existing_intact(v, true);
        if (existing.is_err()) return std::move(existing).error();
        if (existing.value()) {
            log::info("%s is already installed", ver.c_str());
            return Result<CacheEntry>::ok(std::move(*existing.value()));
        }
    }

    std::vector<Binary> required(kAllBinaries.begin(), kAllBinaries.end());
    for (Binary b : required) {
        if (!release.asset(b)) {
            return PenvError{PenvError::NotFound,
                "release " + ver + " has no " + binary_name(b) + " asset"};
        }
    }

    auto begun = InstallTransaction::begin(home_.staging_dir(), v);
    if (begun.is_err()) return std::move(begun).error();
    InstallTransaction tx = std::move(begun).value();

    log::info("installing %s", ver.c_str());

    struct Task {
        Binary binary;
        std::string digest;
        std::future<Status> status;
    };
    std::vector<Task> tasks;
    tasks.reserve(required.size());
    for (Binary b : required) {
        tasks.push_back(Task{b, {}, {}});
    }
    for (auto& task : tasks) {
        const ReleaseAsset* asset = release.asset(task.binary);
        task.status = std::async(std::launch::async, [this, asset, &tx, &task]() {
            return stage_binary(*asset, tx.work_dir(), tx.bin_dir(), task.digest);
        });
    }

    // Join everything before looking at results; staging must be quiescent
    // before it is committed or removed.
    std::vector<Status> results;
    for (auto& task : tasks) {
        results.push_back(task.status.get());
    }

    std::optional<PenvError> failure;
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (results[i].is_err()) {
            log::debug("%s failed: %s", binary_name(tasks[i].binary),
                       results[i].error().message.c_str());
            if (!failure) failure = results[i].error();
            continue;
        }
        tx.add(tasks[i].binary, tasks[i].digest);
    }
    if (failure) {
        tx.abort();
        return *failure;
    }

    PENV_TRY(tx.mark_verified(required));
    auto entry = tx.commit(cache_);
    if (entry.is_ok()) {
        log::info("installed %s", ver.c_str());
    }
    return entry;
}

} // namespace penv
