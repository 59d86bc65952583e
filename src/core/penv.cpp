#include <penv/penv.hpp>
#include <penv/installer.hpp>
#include <penv/fs.hpp>
#include <penv/log.hpp>

namespace penv {

GitCli make_git(const NetworkConfig& network) {
    GitCli git;
    git.set_timeout(network.timeout_seconds);
    git.set_offline(network.offline);
    return git;
}

Penv::Penv(const Home& home, const Config& config, ReleaseSource& source,
           ActiveStateStore& store)
    : home_(home),
      config_(config),
      source_(source),
      index_(source),
      checkouts_(home, make_git(config.network)),
      environments_(home, cache_, checkouts_),
      activation_(home, environments_, cache_, checkouts_, store) {}

Status Penv::open() {
    for (const auto& dir : {home_.root, home_.versions_dir(), home_.staging_dir(),
                            home_.checkouts_dir(), home_.environments_dir(),
                            home_.generations_dir()}) {
        PENV_TRY(ensure_dir(dir));
    }
    return cache_.open(home_.cache_index(), home_.versions_dir());
}

Result<std::optional<Requirement>> Penv::optional_requirement(const std::string& s) {
    if (s.empty()) return Result<std::optional<Requirement>>::ok(std::nullopt);
    auto req = Requirement::parse(s);
    if (req.is_err()) return std::move(req).error();
    if (req.value().is_source()) {
        return PenvError{PenvError::InvalidArg,
            "'" + s + "' is a git source, not a version requirement"};
    }
    return Result<std::optional<Requirement>>::ok(std::move(req).value());
}

Result<InstallOutcome> Penv::install(const std::string& requirement) {
    auto req = Requirement::parse(requirement);
    if (req.is_err()) return std::move(req).error();

    InstallOutcome outcome;
    if (req.value().is_source()) {
        auto checkout = checkouts_.ensure_checkout(req.value().source);
        if (checkout.is_err()) return std::move(checkout).error();
        outcome.version = ResolvedVersion::source(checkout.value().source_url,
                                                  checkout.value().head_commit);
        outcome.checkout = std::move(checkout).value();
        return Result<InstallOutcome>::ok(std::move(outcome));
    }

    // An intact exact version is answered from the cache alone
    if (auto exact = req.value().exact_version()) {
        auto found = cache_.find(*exact);
        if (found.is_err()) return std::move(found).error();
        if (found.value() && verify_entry(*found.value()).is_ok()) {
            log::info("%s is already installed", exact->to_string().c_str());
            outcome.version = ResolvedVersion::release(*exact);
            outcome.entry = std::move(found).value();
            return Result<InstallOutcome>::ok(std::move(outcome));
        }
    }

    auto release = index_.resolve(req.value());
    if (release.is_err()) return std::move(release).error();
    log::info("resolved '%s' to %s", requirement.c_str(),
              release.value().version.to_string().c_str());

    Installer installer(home_, cache_, source_);
    auto entry = installer.install(release.value());
    if (entry.is_err()) return std::move(entry).error();

    outcome.version = ResolvedVersion::release(release.value().version);
    outcome.entry = std::move(entry).value();
    return Result<InstallOutcome>::ok(std::move(outcome));
}

Result<std::vector<AvailableRelease>> Penv::available(const std::string& requirement) {
    auto req = optional_requirement(requirement);
    if (req.is_err()) return std::move(req).error();

    auto releases = index_.matching(req.value());
    if (releases.is_err()) return std::move(releases).error();

    std::vector<AvailableRelease> out;
    for (auto& r : releases.value()) {
        auto installed = cache_.is_installed(r.version);
        if (installed.is_err()) return std::move(installed).error();
        out.push_back(AvailableRelease{std::move(r), installed.value()});
    }
    return Result<std::vector<AvailableRelease>>::ok(std::move(out));
}

Result<std::vector<CacheEntry>> Penv::installed(const std::string& requirement) {
    auto req = optional_requirement(requirement);
    if (req.is_err()) return std::move(req).error();
    return cache_.list(req.value());
}

Status Penv::remove_cached(const std::string& version_or_url) {
    if (looks_like_source(version_or_url)) {
        auto req = Requirement::parse(version_or_url);
        if (req.is_err()) return std::move(req).error();
        return checkouts_.remove(content_address(req.value().source));
    }

    std::string text = version_or_url;
    if (!text.empty() && text[0] == '=') text.erase(0, 1);
    auto version = Version::parse(text);
    if (version.is_err()) return std::move(version).error();
    const std::string v = version.value().to_string();

    // No environment can be pinned to the version while it is uninstalled
    auto env_lock = FileLock::acquire(home_.environments_lock());
    if (env_lock.is_err()) return std::move(env_lock).error();
    auto install_lock = FileLock::acquire(home_.install_lock(v));
    if (install_lock.is_err()) return std::move(install_lock).error();

    auto users = environments_.pinned_to(ResolvedVersion::release(version.value()));
    if (users.is_err()) return std::move(users).error();
    if (!users.value().empty()) {
        std::string names;
        for (const auto& a : users.value()) {
            if (!names.empty()) names += ", ";
            names += a;
        }
        return PenvError{PenvError::InUse, v + " is used by: " + names,
                         "delete or upgrade those environments first"};
    }

    PENV_TRY(cache_.uninstall(version.value()));
    log::info("removed %s from the cache", v.c_str());
    return ok_status();
}

} // namespace penv
