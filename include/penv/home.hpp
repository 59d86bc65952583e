#pragma once

#include <penv/result.hpp>
#include <filesystem>
#include <string>

namespace penv {

namespace fs = std::filesystem;

// On-disk layout of the penv home directory:
//
//   config.toml
//   cache/index.db             installed versions (SQLite)
//   cache/versions/<v>/bin/    installed binaries
//   cache/staging/             in-flight installs
//   cache/locks/<v>.lock       per-version install locks
//   checkouts.toml             checkout registry
//   checkouts/<address>/       git working directories
//   environments.toml          environment registry
//   environments/<alias>/      environment roots
//   active.toml, active.lock   active environment
//   generations/               staged binary directories
//   bin -> generations/<...>   binaries of the active environment
struct Home {
    fs::path root;

    // --home, then $PENUMBRA_PENV_HOME, then $XDG_DATA_HOME/penv,
    // then $HOME/.local/share/penv
    static Result<Home> locate(const std::string& override_dir = "");

    fs::path config_file() const { return root / "config.toml"; }

    fs::path cache_dir() const { return root / "cache"; }
    fs::path cache_index() const { return cache_dir() / "index.db"; }
    fs::path versions_dir() const { return cache_dir() / "versions"; }
    fs::path staging_dir() const { return cache_dir() / "staging"; }
    fs::path install_lock(const std::string& version) const {
        return cache_dir() / "locks" / (version + ".lock");
    }

    fs::path checkouts_file() const { return root / "checkouts.toml"; }
    fs::path checkouts_dir() const { return root / "checkouts"; }
    fs::path checkouts_lock() const { return root / "checkouts.lock"; }

    fs::path environments_file() const { return root / "environments.toml"; }
    fs::path environments_dir() const { return root / "environments"; }
    fs::path environments_lock() const { return root / "environments.lock"; }

    fs::path active_file() const { return root / "active.toml"; }
    fs::path active_lock() const { return root / "active.lock"; }
    fs::path generations_dir() const { return root / "generations"; }
    fs::path bin_link() const { return root / "bin"; }
};

} // namespace penv
