#pragma once

#include <penv/binary.hpp>
#include <penv/checkout.hpp>
#include <penv/home.hpp>
#include <penv/requirement.hpp>
#include <penv/result.hpp>
#include <penv/version_cache.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace penv {

class ActivationController;

struct EnvironmentOptions {
    std::string pd_join_url;       // empty: derived from the gRPC URL
    bool include_node = true;
    bool generate_network = false; // pd generates a local network instead of joining
    bool initialize = true;        // run pcli/pclientd/pd init after laying out the root
};

// A named installation bound to a requirement and a pinned version
struct Environment {
    std::string alias;
    std::string requirement;       // as given at creation
    ResolvedVersion pinned;
    std::string grpc_url;
    std::string pd_join_url;
    bool include_node = true;
    bool generate_network = false;
    std::string root_dir;
    std::optional<std::string> checkout;  // content address, git environments only
    int64_t created_at = 0;

    std::filesystem::path pcli_home() const;
    std::filesystem::path pclientd_home() const;
    std::filesystem::path network_dir() const;
    std::filesystem::path pd_home() const;
    std::filesystem::path cometbft_home() const;

    // Git environments only: a private clone at the pinned commit, and the
    // wrapper scripts that build and run it
    std::filesystem::path source_dir() const;
    std::filesystem::path wrapper_dir() const;

    // pd only when the environment includes a node
    std::vector<Binary> binaries() const;
};

bool is_valid_alias(const std::string& alias);

// Node join URL for a gRPC endpoint: same host, http, port 26657
Result<std::string> default_pd_join_url(const std::string& grpc_url);

struct UpgradeOutcome {
    Environment environment;
    ResolvedVersion previous;
    bool changed = false;
};

// Persisted in <home>/environments.toml; roots live in
// <home>/environments/<alias>. Every read-modify-write holds
// environments.lock.
class EnvironmentRegistry {
public:
    EnvironmentRegistry(const Home& home, VersionCache& cache, CheckoutRegistry& checkouts)
        : home_(home), cache_(cache), checkouts_(checkouts) {}

    // Resolves against installed versions only; never installs
    Result<Environment> create(const std::string& alias, const std::string& requirement,
                               const std::string& grpc_url,
                               const EnvironmentOptions& options = {});

    Result<std::optional<Environment>> find(const std::string& alias);
    // UnknownAlias when not registered
    Result<Environment> get(const std::string& alias);
    Result<std::vector<Environment>> list();

    // Repin to a strictly newer installed version (or a new commit of the
    // checkout). Relinks the binaries when the environment is active.
    Result<UpgradeOutcome> upgrade(const std::string& alias, ActivationController& activation);

    // Deactivates first when active. The checkout is kept.
    Status remove(const std::string& alias, ActivationController& activation);

    // Aliases of environments pinned to `v`
    Result<std::vector<std::string>> pinned_to(const ResolvedVersion& v);

private:
    Result<std::vector<Environment>> load();
    Status save(const std::vector<Environment>& all);
    Result<ResolvedVersion> resolve_installed(const Requirement& req);
    Status create_layout(const Environment& env, bool make_homes);
    Status initialize(const Environment& env);

    Home home_;
    VersionCache& cache_;
    CheckoutRegistry& checkouts_;
};

} // namespace penv
