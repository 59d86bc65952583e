#include <penv/activation.hpp>
#include <penv/log.hpp>
#include <penv/toml_io.hpp>

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace penv {

// ---------------------------------------------------------------------------
// ActiveState stores
// ---------------------------------------------------------------------------

Result<ActiveState> FileActiveStateStore::load() {
    auto doc = load_toml_file(file_);
    if (doc.is_err()) return std::move(doc).error();

    ActiveState state;
    if (auto alias = doc.value()["alias"].value<std::string>()) {
        if (!alias->empty()) state.alias = *alias;
    }
    return Result<ActiveState>::ok(std::move(state));
}

Status FileActiveStateStore::save(const ActiveState& state) {
    toml::table doc;
    if (state.alias) doc.insert("alias", *state.alias);
    return save_toml_file(file_, doc);
}

Result<ActiveState> MemoryActiveStateStore::load() {
    return Result<ActiveState>::ok(state_);
}

Status MemoryActiveStateStore::save(const ActiveState& state) {
    if (fail_saves_) {
        return PenvError{PenvError::IO, "active state store is read-only"};
    }
    state_ = state;
    ++saves_;
    return ok_status();
}

// ---------------------------------------------------------------------------
// Staging
// ---------------------------------------------------------------------------

Status ActivationController::stage_release(const Environment& env,
                                           const std::filesystem::path& gen) {
    const std::string version = env.pinned.version.to_string();
    auto entry = cache_.find(env.pinned.version);
    if (entry.is_err()) return std::move(entry).error();
    if (!entry.value()) {
        return PenvError{PenvError::VersionNotInstalled,
            "version " + version + " of environment '" + env.alias + "' is not installed",
            "run `penv install =" + version + "`"};
    }

    for (Binary b : env.binaries()) {
        const CachedBinary* cached = entry.value()->binary(b);
        std::error_code ec;
        if (!cached || !std::filesystem::is_regular_file(cached->path, ec)) {
            return PenvError{PenvError::ActivationFailed,
                std::string(binary_name(b)) + " " + version + " is missing from the cache",
                "run `penv cache delete " + version + "` and reinstall it"};
        }
        const auto link = gen / binary_name(b);
        if (symlink(cached->path.c_str(), link.c_str()) != 0) {
            return PenvError{PenvError::ActivationFailed,
                "cannot link " + link.string() + ": " + strerror(errno)};
        }
    }
    return ok_status();
}

Status ActivationController::stage_source(const Environment& env,
                                          const std::filesystem::path& gen) {
    std::error_code ec;
    if (!std::filesystem::is_directory(env.source_dir(), ec)) {
        return PenvError{PenvError::ActivationFailed,
            "environment '" + env.alias + "' has no source tree at " + env.source_dir().string(),
            "run `penv manage delete " + env.alias + "` and create it again"};
    }
    auto head = checkouts_.tree_commit(env.source_dir());
    if (head.is_err()) return std::move(head).error();
    if (head.value() != env.pinned.commit) {
        return PenvError{PenvError::ActivationFailed,
            "source tree of '" + env.alias + "' is at " + head.value().substr(0, 10) +
            ", pinned to " + env.pinned.commit.substr(0, 10),
            "run `penv manage upgrade " + env.alias + "` or recreate the environment"};
    }

    for (Binary b : env.binaries()) {
        const auto wrapper = env.wrapper_dir() / binary_name(b);
        if (!std::filesystem::is_regular_file(wrapper, ec)) {
            return PenvError{PenvError::ActivationFailed,
                "missing wrapper " + wrapper.string()};
        }
        const auto link = gen / binary_name(b);
        if (symlink(wrapper.c_str(), link.c_str()) != 0) {
            return PenvError{PenvError::ActivationFailed,
                "cannot link " + link.string() + ": " + strerror(errno)};
        }
    }
    return ok_status();
}

std::optional<std::filesystem::path> ActivationController::current_generation() const {
    std::error_code ec;
    auto target = std::filesystem::read_symlink(home_.bin_link(), ec);
    if (ec) return std::nullopt;
    return target;
}

void ActivationController::discard_generation(
        const std::optional<std::filesystem::path>& gen) const {
    // Only directories we created; <home>/bin may have been pointed elsewhere by hand
    if (!gen || gen->parent_path() != home_.generations_dir()) return;
    auto removed = remove_tree(*gen);
    if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

Result<FileLock> ActivationController::lock() {
    return FileLock::acquire(home_.active_lock());
}

Result<Environment> ActivationController::use(const std::string& alias) {
    auto held = lock();
    if (held.is_err()) return std::move(held).error();

    auto env = environments_.get(alias);
    if (env.is_err()) return std::move(env).error();
    return use_locked(env.value(), held.value());
}

Result<Environment> ActivationController::use_locked(const Environment& env,
                                                     const FileLock& /*held*/) {
    auto gen = make_unique_dir(home_.generations_dir(), env.alias);
    if (gen.is_err()) return std::move(gen).error();

    Status staged = env.pinned.is_source() ? stage_source(env, gen.value())
                                           : stage_release(env, gen.value());
    if (staged.is_err()) {
        discard_generation(gen.value());
        return std::move(staged).error();
    }

    const auto previous = current_generation();
    auto swapped = replace_symlink(home_.bin_link(), gen.value());
    if (swapped.is_err()) {
        discard_generation(gen.value());
        auto err = std::move(swapped).error();
        err.code = PenvError::ActivationFailed;
        return err;
    }

    auto saved = store_.save(ActiveState{env.alias});
    if (saved.is_err()) {
        Status restored = previous ? replace_symlink(home_.bin_link(), *previous)
                                   : remove_tree(home_.bin_link());
        if (restored.is_err()) log::error("%s", restored.error().message.c_str());
        discard_generation(gen.value());
        auto err = std::move(saved).error().context("cannot record the active environment");
        err.code = PenvError::ActivationFailed;
        return err;
    }

    if (previous != gen.value()) discard_generation(previous);
    log::info("activated '%s' (%s)", env.alias.c_str(), env.pinned.display().c_str());
    return Result<Environment>::ok(env);
}

Status ActivationController::deactivate() {
    auto held = lock();
    if (held.is_err()) return std::move(held).error();
    return deactivate_locked(held.value());
}

Status ActivationController::deactivate_locked(const FileLock& /*held*/) {
    auto state = store_.load();
    if (state.is_err()) return std::move(state).error();

    PENV_TRY(store_.save(ActiveState{}));

    const auto previous = current_generation();
    std::error_code ec;
    std::filesystem::remove(home_.bin_link(), ec);
    if (ec) {
        auto restored = store_.save(state.value());
        if (restored.is_err()) log::error("%s", restored.error().message.c_str());
        return PenvError{PenvError::IO,
            "cannot remove " + home_.bin_link().string() + ": " + ec.message()};
    }
    discard_generation(previous);

    if (state.value().alias) {
        log::info("deactivated '%s'", state.value().alias->c_str());
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<std::optional<std::string>> ActivationController::active_alias() {
    auto state = store_.load();
    if (state.is_err()) return std::move(state).error();
    return Result<std::optional<std::string>>::ok(state.value().alias);
}

Result<std::optional<Environment>> ActivationController::current() {
    auto alias = active_alias();
    if (alias.is_err()) return std::move(alias).error();
    if (!alias.value()) return Result<std::optional<Environment>>::ok(std::nullopt);

    auto env = environments_.find(*alias.value());
    if (env.is_err()) return std::move(env).error();
    if (!env.value()) {
        log::debug("active alias '%s' no longer exists", alias.value()->c_str());
    }
    return env;
}

} // namespace penv
