#pragma once

#include <penv/checkout.hpp>
#include <penv/environment.hpp>
#include <penv/fs.hpp>
#include <penv/home.hpp>
#include <penv/result.hpp>
#include <penv/version_cache.hpp>

#include <optional>
#include <string>

namespace penv {

struct ActiveState {
    std::optional<std::string> alias;
};

// Where the active alias is kept between invocations
class ActiveStateStore {
public:
    virtual ~ActiveStateStore() = default;

    virtual Result<ActiveState> load() = 0;
    virtual Status save(const ActiveState& state) = 0;
};

// <home>/active.toml; a missing file is the empty state
class FileActiveStateStore : public ActiveStateStore {
public:
    explicit FileActiveStateStore(std::filesystem::path file) : file_(std::move(file)) {}

    Result<ActiveState> load() override;
    Status save(const ActiveState& state) override;

private:
    std::filesystem::path file_;
};

class MemoryActiveStateStore : public ActiveStateStore {
public:
    Result<ActiveState> load() override;
    Status save(const ActiveState& state) override;

    // Make every subsequent save() fail
    void fail_saves(bool fail) { fail_saves_ = fail; }
    int save_count() const { return saves_; }

private:
    ActiveState state_;
    bool fail_saves_ = false;
    int saves_ = 0;
};

// Switches <home>/bin between environments. Each switch stages a fresh
// generation directory, then repoints the symlink with one rename, then
// records the alias. A failure at any step leaves both the link and the
// recorded alias as they were.
class ActivationController {
public:
    ActivationController(const Home& home, EnvironmentRegistry& environments,
                         VersionCache& cache, CheckoutRegistry& checkouts,
                         ActiveStateStore& store)
        : home_(home), environments_(environments), cache_(cache),
          checkouts_(checkouts), store_(store) {}

    // The global active.lock. Held by every mutation.
    Result<FileLock> lock();

    Result<Environment> use(const std::string& alias);
    Status deactivate();

    // Variants for callers already holding lock()
    Result<Environment> use_locked(const Environment& env, const FileLock& held);
    Status deactivate_locked(const FileLock& held);

    // None when inactive or when the recorded alias no longer exists
    Result<std::optional<Environment>> current();
    Result<std::optional<std::string>> active_alias();

private:
    Status stage_release(const Environment& env, const std::filesystem::path& gen);
    Status stage_source(const Environment& env, const std::filesystem::path& gen);
    std::optional<std::filesystem::path> current_generation() const;
    void discard_generation(const std::optional<std::filesystem::path>& gen) const;

    Home home_;
    EnvironmentRegistry& environments_;
    VersionCache& cache_;
    CheckoutRegistry& checkouts_;
    ActiveStateStore& store_;
};

} // namespace penv
