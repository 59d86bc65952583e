#pragma once

#include <penv/activation.hpp>
#include <penv/checkout.hpp>
#include <penv/config.hpp>
#include <penv/environment.hpp>
#include <penv/home.hpp>
#include <penv/release.hpp>
#include <penv/result.hpp>
#include <penv/version_cache.hpp>

#include <optional>
#include <string>
#include <vector>

namespace penv {

struct InstallOutcome {
    ResolvedVersion version;
    std::optional<CacheEntry> entry;   // releases
    std::optional<Checkout> checkout;  // git sources
};

struct AvailableRelease {
    Release release;
    bool installed = false;
};

// One penv home with every registry opened on it. The release source
// and the active-state store are supplied by the caller.
class Penv {
public:
    Penv(const Home& home, const Config& config, ReleaseSource& source,
         ActiveStateStore& store);

    Penv(const Penv&) = delete;
    Penv& operator=(const Penv&) = delete;

    // Create the home layout and open the cache index
    Status open();

    // Install a release (resolved against the Release Index) or clone a
    // git source
    Result<InstallOutcome> install(const std::string& requirement);

    // Published releases, optionally filtered, with their install status
    Result<std::vector<AvailableRelease>> available(const std::string& requirement = "");
    Result<std::vector<CacheEntry>> installed(const std::string& requirement = "");

    // Uninstall a version or delete a checkout. InUse while an environment
    // still needs it.
    Status remove_cached(const std::string& version_or_url);

    const Home& home() const { return home_; }
    const Config& config() const { return config_; }
    VersionCache& cache() { return cache_; }
    ReleaseIndex& releases() { return index_; }
    CheckoutRegistry& checkouts() { return checkouts_; }
    EnvironmentRegistry& environments() { return environments_; }
    ActivationController& activation() { return activation_; }

private:
    Result<std::optional<Requirement>> optional_requirement(const std::string& s);

    Home home_;
    Config config_;
    ReleaseSource& source_;
    VersionCache cache_;
    ReleaseIndex index_;
    CheckoutRegistry checkouts_;
    EnvironmentRegistry environments_;
    ActivationController activation_;
};

// GitCli configured from [network]
GitCli make_git(const NetworkConfig& network);

} // namespace penv
