#include <penv/environment.hpp>
#include <penv/activation.hpp>
#include <penv/fs.hpp>
#include <penv/initializer.hpp>
#include <penv/log.hpp>
#include <penv/process.hpp>
#include <penv/resolver.hpp>
#include <penv/template.hpp>
#include <penv/toml_io.hpp>
#include <penv/url.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <sys/stat.h>

namespace penv {

std::filesystem::path Environment::pcli_home() const {
    return std::filesystem::path(root_dir) / "pcli";
}

std::filesystem::path Environment::pclientd_home() const {
    return std::filesystem::path(root_dir) / "pclientd";
}

std::filesystem::path Environment::network_dir() const {
    return std::filesystem::path(root_dir) / "network_data";
}

std::filesystem::path Environment::pd_home() const {
    return network_dir() / "node0" / "pd";
}

std::filesystem::path Environment::cometbft_home() const {
    return network_dir() / "node0" / "cometbft";
}

std::filesystem::path Environment::source_dir() const {
    return std::filesystem::path(root_dir) / "checkout";
}

std::filesystem::path Environment::wrapper_dir() const {
    return std::filesystem::path(root_dir) / "bin";
}

std::vector<Binary> Environment::binaries() const {
    std::vector<Binary> out;
    for (Binary b : kAllBinaries) {
        if (is_node_binary(b) && !include_node) continue;
        out.push_back(b);
    }
    return out;
}

bool is_valid_alias(const std::string& alias) {
    if (alias.empty() || !std::isalnum(static_cast<unsigned char>(alias[0]))) return false;
    for (char c : alias) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

Result<std::string> default_pd_join_url(const std::string& grpc_url) {
    auto url = Url::parse(grpc_url);
    if (url.is_err()) return std::move(url).error();
    Url join = url.value().with_scheme("http").with_port(26657);
    join.path.clear();
    return Result<std::string>::ok(join.to_string());
}

// pd network generate and a first cargo build of a git tree can be slow
static constexpr int kInitTimeoutSeconds = 3600;

static std::vector<Environment>::iterator find_alias(std::vector<Environment>& all,
                                                     const std::string& alias) {
    return std::find_if(all.begin(), all.end(),
                        [&](const Environment& e) { return e.alias == alias; });
}

static PenvError unknown_alias(const std::string& alias) {
    return PenvError{PenvError::UnknownAlias,
        "no environment named '" + alias + "'", "see `penv manage list`"};
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

Result<std::vector<Environment>> EnvironmentRegistry::load() {
    const auto file = home_.environments_file();
    auto doc = load_toml_file(file);
    if (doc.is_err()) return std::move(doc).error();

    std::vector<Environment> out;
    auto arr = doc.value()["environment"].as_array();
    if (!arr) return Result<std::vector<Environment>>::ok(std::move(out));

    for (const auto& node : *arr) {
        const toml::table* tbl = node.as_table();
        if (!tbl) {
            return PenvError{PenvError::Parse, "environment entry is not a table", "",
                             file.string(), 0};
        }

        Environment env;
        auto alias = required_string(*tbl, "alias", file);
        if (alias.is_err()) return std::move(alias).error();
        env.alias = alias.value();

        auto requirement = required_string(*tbl, "requirement", file);
        if (requirement.is_err()) return std::move(requirement).error();
        env.requirement = requirement.value();

        auto pinned = required_string(*tbl, "pinned", file);
        if (pinned.is_err()) return std::move(pinned).error();
        auto resolved = ResolvedVersion::parse(pinned.value());
        if (resolved.is_err()) {
            return std::move(resolved).error().context("environment '" + env.alias + "'");
        }
        env.pinned = resolved.value();

        auto grpc = required_string(*tbl, "grpc_url", file);
        if (grpc.is_err()) return std::move(grpc).error();
        env.grpc_url = grpc.value();

        env.pd_join_url = (*tbl)["pd_join_url"].value_or(std::string{});
        env.include_node = (*tbl)["include_node"].value_or(true);
        env.generate_network = (*tbl)["generate_network"].value_or(false);
        env.root_dir = (*tbl)["root"].value_or((home_.environments_dir() / env.alias).string());
        if (auto checkout = (*tbl)["checkout"].value<std::string>()) {
            env.checkout = *checkout;
        }
        env.created_at = (*tbl)["created_at"].value_or(int64_t{0});
        out.push_back(std::move(env));
    }
    return Result<std::vector<Environment>>::ok(std::move(out));
}

Status EnvironmentRegistry::save(const std::vector<Environment>& all) {
    toml::array arr;
    for (const auto& env : all) {
        toml::table tbl;
        tbl.insert("alias", env.alias);
        tbl.insert("requirement", env.requirement);
        tbl.insert("pinned", env.pinned.to_string());
        tbl.insert("grpc_url", env.grpc_url);
        tbl.insert("pd_join_url", env.pd_join_url);
        tbl.insert("include_node", env.include_node);
        tbl.insert("generate_network", env.generate_network);
        tbl.insert("root", env.root_dir);
        if (env.checkout) tbl.insert("checkout", *env.checkout);
        tbl.insert("created_at", env.created_at);
        arr.push_back(std::move(tbl));
    }
    toml::table doc;
    doc.insert("environment", std::move(arr));
    return save_toml_file(home_.environments_file(), doc);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<std::optional<Environment>> EnvironmentRegistry::find(const std::string& alias) {
    auto all = load();
    if (all.is_err()) return std::move(all).error();
    auto it = find_alias(all.value(), alias);
    if (it == all.value().end()) {
        return Result<std::optional<Environment>>::ok(std::nullopt);
    }
    return Result<std::optional<Environment>>::ok(std::move(*it));
}

Result<Environment> EnvironmentRegistry::get(const std::string& alias) {
    auto found = find(alias);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) return unknown_alias(alias);
    return Result<Environment>::ok(std::move(*found.value()));
}

Result<std::vector<Environment>> EnvironmentRegistry::list() {
    auto all = load();
    if (all.is_err()) return all;
    std::sort(all.value().begin(), all.value().end(),
              [](const Environment& a, const Environment& b) { return a.alias < b.alias; });
    return all;
}

Result<std::vector<std::string>> EnvironmentRegistry::pinned_to(const ResolvedVersion& v) {
    auto all = load();
    if (all.is_err()) return std::move(all).error();
    std::vector<std::string> aliases;
    for (const auto& env : all.value()) {
        if (env.pinned == v) aliases.push_back(env.alias);
    }
    return Result<std::vector<std::string>>::ok(std::move(aliases));
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

Result<ResolvedVersion> EnvironmentRegistry::resolve_installed(const Requirement& req) {
    if (req.is_source()) {
        auto checkout = checkouts_.find_by_url(req.source);
        if (checkout.is_err()) return std::move(checkout).error();
        if (!checkout.value()) {
            return PenvError{PenvError::VersionNotInstalled,
                "no checkout of " + req.source,
                "run `penv install " + req.raw + "` first"};
        }
        return Result<ResolvedVersion>::ok(
            ResolvedVersion::source(req.source, checkout.value()->head_commit));
    }

    auto installed = cache_.versions();
    if (installed.is_err()) return std::move(installed).error();

    auto resolved = resolve(req, installed.value());
    if (resolved.is_err()) {
        const auto& err = resolved.error();
        if (err.code == PenvError::NotFound || err.code == PenvError::NoReleases) {
            return PenvError{PenvError::VersionNotInstalled,
                "no installed version satisfies '" + req.raw + "'",
                "run `penv install " + req.raw + "` first"};
        }
        return resolved;
    }
    return resolved;
}

// Wrappers are rendered against the final root; the staging directory
// is renamed onto it before anything runs them.
static const char* kWrapperTemplate =
    "#!/bin/sh\n"
    "# {{ binary }} for penv environment {{ alias }}, built from {{ url }} at {{ commit }}\n"
    "set -e\n"
    "cargo build --quiet --release --manifest-path {{ manifest }} --bin {{ binary }} >&2\n"
    "exec {{ executable }} \"$@\"\n";

static Status write_wrappers(const Environment& env, const std::filesystem::path& dir) {
    PENV_TRY(ensure_dir(dir));
    const std::filesystem::path tree = env.source_dir();
    for (Binary b : env.binaries()) {
        TemplateVars vars;
        vars["binary"] = binary_name(b);
        vars["alias"] = env.alias;
        vars["url"] = env.pinned.url;
        vars["commit"] = env.pinned.commit;
        vars["manifest"] = shell_quote((tree / "Cargo.toml").string());
        vars["executable"] = shell_quote((tree / "target" / "release" / binary_name(b)).string());

        auto script = render_template(kWrapperTemplate, vars);
        if (script.is_err()) return std::move(script).error();

        const auto path = dir / binary_name(b);
        PENV_TRY(write_file_atomic(path, script.value()));
        if (chmod(path.c_str(), 0755) != 0) {
            return PenvError{PenvError::IO,
                "cannot make " + path.string() + " executable: " + strerror(errno)};
        }
    }
    return ok_status();
}

Status EnvironmentRegistry::create_layout(const Environment& env, bool make_homes) {
    const std::filesystem::path root = env.root_dir;
    auto staging = make_unique_dir(home_.environments_dir(), ".staging-" + env.alias);
    if (staging.is_err()) return std::move(staging).error();
    const auto& dir = staging.value();

    auto discard = [&]() {
        auto removed = remove_tree(dir);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    };

    // The binaries' own init creates their homes when it runs
    std::vector<std::filesystem::path> dirs;
    if (make_homes) {
        dirs = {dir / "pcli", dir / "pclientd"};
        if (env.include_node) {
            dirs.push_back(dir / "network_data" / "node0" / "pd");
            dirs.push_back(dir / "network_data" / "node0" / "cometbft");
        }
    }
    for (const auto& d : dirs) {
        auto made = ensure_dir(d);
        if (made.is_err()) {
            discard();
            return made;
        }
    }

    if (env.pinned.is_source()) {
        Status tree = checkouts_.clone_tree(*env.checkout, dir / "checkout", env.pinned.commit);
        if (tree.is_ok()) tree = write_wrappers(env, dir / "bin");
        if (tree.is_err()) {
            discard();
            return tree;
        }
    }

    std::error_code ec;
    // Left behind by an interrupted create or delete; nothing references it
    if (std::filesystem::exists(root, ec)) {
        log::warn("removing stale environment directory %s", root.c_str());
        PENV_TRY(remove_tree(root));
    }
    std::filesystem::rename(dir, root, ec);
    if (ec) {
        discard();
        return PenvError{PenvError::IO,
            "cannot create environment directory " + root.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status EnvironmentRegistry::initialize(const Environment& env) {
    BinaryPaths executables;
    if (env.pinned.is_source()) {
        for (Binary b : env.binaries()) executables[b] = env.wrapper_dir() / binary_name(b);
    } else {
        auto entry = cache_.find(env.pinned.version);
        if (entry.is_err()) return std::move(entry).error();
        if (!entry.value()) {
            return PenvError{PenvError::VersionNotInstalled,
                "version " + env.pinned.version.to_string() + " is not installed"};
        }
        for (Binary b : env.binaries()) {
            if (const CachedBinary* cached = entry.value()->binary(b)) {
                executables[b] = cached->path;
            }
        }
    }

    EnvironmentInitializer initializer(kInitTimeoutSeconds);
    return initializer.initialize(env, executables);
}

Result<Environment> EnvironmentRegistry::create(const std::string& alias,
                                                const std::string& requirement,
                                                const std::string& grpc_url,
                                                const EnvironmentOptions& options) {
    if (!is_valid_alias(alias)) {
        return PenvError{PenvError::InvalidArg, "invalid alias '" + alias + "'",
            "aliases start with a letter or digit and contain only letters, digits, '.', '_' and '-'"};
    }
    auto req = Requirement::parse(requirement);
    if (req.is_err()) return std::move(req).error();

    auto grpc = Url::parse(grpc_url);
    if (grpc.is_err()) return std::move(grpc).error().context("gRPC URL");

    std::string join_url = options.pd_join_url;
    if (join_url.empty()) {
        auto derived = default_pd_join_url(grpc_url);
        if (derived.is_err()) return std::move(derived).error();
        join_url = derived.value();
    } else {
        auto parsed = Url::parse(join_url);
        if (parsed.is_err()) return std::move(parsed).error().context("pd join URL");
    }

    auto lock = FileLock::acquire(home_.environments_lock());
    if (lock.is_err()) return std::move(lock).error();

    auto all = load();
    if (all.is_err()) return std::move(all).error();
    if (find_alias(all.value(), alias) != all.value().end()) {
        return PenvError{PenvError::DuplicateAlias,
            "an environment named '" + alias + "' already exists",
            "pick another alias or run `penv manage delete " + alias + "`"};
    }

    auto pinned = resolve_installed(req.value());
    if (pinned.is_err()) return std::move(pinned).error();

    Environment env;
    env.alias = alias;
    env.requirement = requirement;
    env.pinned = pinned.value();
    env.grpc_url = grpc_url;
    env.pd_join_url = join_url;
    env.include_node = options.include_node;
    env.generate_network = options.generate_network;
    env.root_dir = (home_.environments_dir() / alias).string();
    env.created_at = unix_now();
    if (env.pinned.is_source()) env.checkout = content_address(env.pinned.url);

    PENV_TRY(create_layout(env, !options.initialize));

    auto rollback_layout = [&]() {
        auto removed = remove_tree(env.root_dir);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    };

    if (options.initialize) {
        auto initialized = initialize(env);
        if (initialized.is_err()) {
            rollback_layout();
            return std::move(initialized).error();
        }
    }

    if (env.checkout) {
        auto ref = checkouts_.add_reference(*env.checkout, alias);
        if (ref.is_err()) {
            rollback_layout();
            return std::move(ref).error();
        }
    }

    all.value().push_back(env);
    auto saved = save(all.value());
    if (saved.is_err()) {
        if (env.checkout) {
            auto released = checkouts_.release_reference(*env.checkout, alias);
            if (released.is_err()) log::warn("%s", released.error().message.c_str());
        }
        rollback_layout();
        return std::move(saved).error();
    }

    log::info("created environment '%s' pinned to %s", alias.c_str(),
              env.pinned.display().c_str());
    return Result<Environment>::ok(std::move(env));
}

Result<UpgradeOutcome> EnvironmentRegistry::upgrade(const std::string& alias,
                                                    ActivationController& activation) {
    auto active_lock = activation.lock();
    if (active_lock.is_err()) return std::move(active_lock).error();
    auto lock = FileLock::acquire(home_.environments_lock());
    if (lock.is_err()) return std::move(lock).error();

    auto all = load();
    if (all.is_err()) return std::move(all).error();
    auto it = find_alias(all.value(), alias);
    if (it == all.value().end()) return unknown_alias(alias);

    UpgradeOutcome outcome;
    outcome.previous = it->pinned;

    if (it->pinned.is_source()) {
        if (!it->checkout) {
            return PenvError{PenvError::Parse,
                "environment '" + alias + "' has no checkout reference"};
        }
        auto refreshed = checkouts_.refresh(*it->checkout);
        if (refreshed.is_err()) return std::move(refreshed).error();
        if (refreshed.value().head_commit != it->pinned.commit) {
            PENV_TRY(checkouts_.move_tree(*it->checkout, it->source_dir(),
                                          refreshed.value().head_commit));
            it->pinned = ResolvedVersion::source(it->pinned.url, refreshed.value().head_commit);
            outcome.changed = true;
        }
    } else {
        auto req = Requirement::parse(it->requirement);
        if (req.is_err()) return std::move(req).error();
        auto resolved = resolve_installed(req.value());
        if (resolved.is_err()) return std::move(resolved).error();
        if (resolved.value().version > it->pinned.version) {
            it->pinned = resolved.value();
            outcome.changed = true;
        }
    }

    outcome.environment = *it;
    if (!outcome.changed) {
        log::info("environment '%s' is already at the latest version (%s)",
                  alias.c_str(), it->pinned.display().c_str());
        return Result<UpgradeOutcome>::ok(std::move(outcome));
    }

    // Puts a git environment's tree back on the previous commit
    auto restore_tree = [&]() {
        if (!outcome.previous.is_source()) return;
        auto back = checkouts_.move_tree(*it->checkout, it->source_dir(), outcome.previous.commit);
        if (back.is_err()) log::error("%s", back.error().message.c_str());
    };

    auto saved = save(all.value());
    if (saved.is_err()) {
        restore_tree();
        return std::move(saved).error();
    }

    auto active = activation.active_alias();
    if (active.is_err()) return std::move(active).error();
    if (active.value() && *active.value() == alias) {
        auto relinked = activation.use_locked(outcome.environment, active_lock.value());
        if (relinked.is_err()) {
            it->pinned = outcome.previous;
            auto restored = save(all.value());
            if (restored.is_err()) log::error("%s", restored.error().message.c_str());
            restore_tree();
            return std::move(relinked).error();
        }
    }

    log::info("upgraded environment '%s' from %s to %s", alias.c_str(),
              outcome.previous.display().c_str(), outcome.environment.pinned.display().c_str());
    return Result<UpgradeOutcome>::ok(std::move(outcome));
}

Status EnvironmentRegistry::remove(const std::string& alias, ActivationController& activation) {
    auto active_lock = activation.lock();
    if (active_lock.is_err()) return std::move(active_lock).error();
    auto lock = FileLock::acquire(home_.environments_lock());
    if (lock.is_err()) return std::move(lock).error();

    auto all = load();
    if (all.is_err()) return std::move(all).error();
    auto it = find_alias(all.value(), alias);
    if (it == all.value().end()) return unknown_alias(alias);
    const Environment env = *it;

    auto active = activation.active_alias();
    if (active.is_err()) return std::move(active).error();
    if (active.value() && *active.value() == alias) {
        PENV_TRY(activation.deactivate_locked(active_lock.value()));
    }

    // Move the root aside so a failed save can put it back
    const std::filesystem::path root = env.root_dir;
    std::filesystem::path trash;
    std::error_code ec;
    if (std::filesystem::exists(root, ec)) {
        trash = home_.environments_dir() / (".trash-" + alias + "-" + random_hex(8));
        std::filesystem::rename(root, trash, ec);
        if (ec) {
            return PenvError{PenvError::IO,
                "cannot remove environment directory " + root.string() + ": " + ec.message()};
        }
    }

    all.value().erase(it);
    auto saved = save(all.value());
    if (saved.is_err()) {
        if (!trash.empty()) {
            std::filesystem::rename(trash, root, ec);
            if (ec) log::error("cannot restore %s: %s", root.c_str(), ec.message().c_str());
        }
        return saved;
    }

    if (env.checkout) {
        auto left = checkouts_.release_reference(*env.checkout, alias);
        if (left.is_err()) {
            log::warn("%s", left.error().message.c_str());
        } else if (left.value() == 0) {
            log::info("checkout of %s is no longer used by any environment", env.pinned.url.c_str());
        }
    }

    if (!trash.empty()) {
        auto removed = remove_tree(trash);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    }
    log::info("deleted environment '%s'", alias.c_str());
    return ok_status();
}

} // namespace penv
