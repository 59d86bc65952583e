#pragma once

#include <penv/git.hpp>
#include <penv/home.hpp>
#include <penv/result.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace penv {

// A git working directory shared by every environment built from the
// same source URL
struct Checkout {
    std::string source_url;
    std::string address;      // hex sha256 of source_url
    std::string workdir;
    std::string head_commit;
    int64_t last_fetched_at = 0;
    std::set<std::string> referenced_by;  // environment aliases
};

std::string content_address(const std::string& url);

// Persisted in <home>/checkouts.toml. Working directories live in
// <home>/checkouts/<address>.
class CheckoutRegistry {
public:
    CheckoutRegistry(const Home& home, GitCli git) : home_(home), git_(std::move(git)) {}

    // Reuse the checkout for `url`, or clone it. Idempotent per URL.
    Result<Checkout> ensure_checkout(const std::string& url);

    // Fetch remote updates and fast-forward the checked-out branch.
    // Untracked build output is left alone.
    Result<Checkout> refresh(const std::string& address);

    // A private working tree of the checkout at `commit`, for one
    // environment. The tree's origin is the shared checkout, so later
    // commits come from it without touching the network.
    Status clone_tree(const std::string& address, const std::filesystem::path& tree,
                      const std::string& commit);
    // Fetch the shared checkout's commits into `tree` and check out `commit`
    Status move_tree(const std::string& address, const std::filesystem::path& tree,
                     const std::string& commit);
    Result<std::string> tree_commit(const std::filesystem::path& tree);

    Result<std::vector<Checkout>> list();
    Result<std::optional<Checkout>> get(const std::string& address);
    Result<std::optional<Checkout>> find_by_url(const std::string& url);

    Status add_reference(const std::string& address, const std::string& alias);
    // Returns the number of references left
    Result<size_t> release_reference(const std::string& address, const std::string& alias);

    // Delete an unreferenced checkout; InUse while referenced
    Status remove(const std::string& address);

private:
    Result<std::vector<Checkout>> load();
    Status save(const std::vector<Checkout>& all);
    std::filesystem::path address_lock(const std::string& address) const;

    // Apply `mutate` to the record for `address` under the registry lock
    template<typename F>
    Result<Checkout> update(const std::string& address, F&& mutate);

    Home home_;
    GitCli git_;
};

} // namespace penv
