#include <penv/checkout.hpp>
#include <penv/fs.hpp>
#include <penv/log.hpp>
#include <penv/sha256.hpp>
#include <penv/toml_io.hpp>

#include <algorithm>

namespace penv {

std::string content_address(const std::string& url) {
    return Sha256::hash_hex(url);
}

std::filesystem::path CheckoutRegistry::address_lock(const std::string& address) const {
    return home_.checkouts_dir() / (address + ".lock");
}

Result<std::vector<Checkout>> CheckoutRegistry::load() {
    const auto file = home_.checkouts_file();
    auto doc = load_toml_file(file);
    if (doc.is_err()) return std::move(doc).error();

    std::vector<Checkout> out;
    if (auto arr = doc.value()["checkout"].as_array()) {
        for (const auto& node : *arr) {
            const toml::table* tbl = node.as_table();
            if (!tbl) continue;

            Checkout c;
            auto url = required_string(*tbl, "url", file);
            if (url.is_err()) return std::move(url).error();
            c.source_url = url.value();
            c.address = tbl->get("address") ? (*tbl)["address"].value_or(std::string{})
                                            : content_address(c.source_url);
            c.workdir = (*tbl)["path"].value_or((home_.checkouts_dir() / c.address).string());
            c.head_commit = (*tbl)["commit"].value_or(std::string{});
            c.last_fetched_at = (*tbl)["last_fetched_at"].value_or(int64_t{0});
            for (auto& alias : from_toml_array((*tbl)["referenced_by"].as_array())) {
                c.referenced_by.insert(std::move(alias));
            }
            out.push_back(std::move(c));
        }
    }
    return Result<std::vector<Checkout>>::ok(std::move(out));
}

Status CheckoutRegistry::save(const std::vector<Checkout>& all) {
    toml::array arr;
    for (const auto& c : all) {
        toml::table tbl;
        tbl.insert("url", c.source_url);
        tbl.insert("address", c.address);
        tbl.insert("path", c.workdir);
        tbl.insert("commit", c.head_commit);
        tbl.insert("last_fetched_at", c.last_fetched_at);
        tbl.insert("referenced_by", to_toml_array(
            std::vector<std::string>(c.referenced_by.begin(), c.referenced_by.end())));
        arr.push_back(std::move(tbl));
    }
    toml::table doc;
    doc.insert("checkout", std::move(arr));
    return save_toml_file(home_.checkouts_file(), doc);
}

template<typename F>
Result<Checkout> CheckoutRegistry::update(const std::string& address, F&& mutate) {
    auto lock = FileLock::acquire(home_.checkouts_lock());
    if (lock.is_err()) return std::move(lock).error();

    auto all = load();
    if (all.is_err()) return std::move(all).error();

    auto it = std::find_if(all.value().begin(), all.value().end(),
                           [&](const Checkout& c) { return c.address == address; });
    if (it == all.value().end()) {
        return PenvError{PenvError::NotFound, "no checkout with address " + address};
    }
    PENV_TRY(mutate(*it));
    Checkout updated = *it;
    PENV_TRY(save(all.value()));
    return Result<Checkout>::ok(std::move(updated));
}

Result<std::vector<Checkout>> CheckoutRegistry::list() {
    return load();
}

Result<std::optional<Checkout>> CheckoutRegistry::get(const std::string& address) {
    auto all = load();
    if (all.is_err()) return std::move(all).error();
    for (auto& c : all.value()) {
        if (c.address == address) return Result<std::optional<Checkout>>::ok(std::move(c));
    }
    return Result<std::optional<Checkout>>::ok(std::nullopt);
}

Result<std::optional<Checkout>> CheckoutRegistry::find_by_url(const std::string& url) {
    return get(content_address(url));
}

Result<Checkout> CheckoutRegistry::ensure_checkout(const std::string& url) {
    const std::string address = content_address(url);
    const std::filesystem::path workdir = home_.checkouts_dir() / address;

    // Serializes clones of the same URL; unrelated URLs proceed in parallel
    auto clone_lock = FileLock::acquire(address_lock(address));
    if (clone_lock.is_err()) return std::move(clone_lock).error();

    auto existing = get(address);
    if (existing.is_err()) return std::move(existing).error();
    std::error_code ec;
    if (existing.value() && std::filesystem::exists(workdir / ".git", ec)) {
        log::debug("reusing checkout %s for %s", address.substr(0, 12).c_str(), url.c_str());
        return Result<Checkout>::ok(std::move(*existing.value()));
    }

    auto staging = make_unique_dir(home_.checkouts_dir(), ".staging-" + address.substr(0, 12));
    if (staging.is_err()) return std::move(staging).error();
    const auto clone_dir = staging.value() / "src";

    log::info("cloning %s", url.c_str());
    auto cloned = git_.clone(url, clone_dir.string());
    if (cloned.is_err()) {
        auto removed = remove_tree(staging.value());
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return std::move(cloned).error();
    }

    auto commit = git_.head_commit(clone_dir.string());
    if (commit.is_err()) {
        auto removed = remove_tree(staging.value());
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return std::move(commit).error();
    }

    // A directory without a registry record is left over from a crash
    if (std::filesystem::exists(workdir, ec)) {
        log::warn("replacing unregistered checkout directory %s", workdir.c_str());
        PENV_TRY(remove_tree(workdir));
    }
    std::filesystem::rename(clone_dir, workdir, ec);
    auto removed = remove_tree(staging.value());
    if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot move checkout into " + workdir.string() + ": " + ec.message()};
    }

    Checkout checkout;
    checkout.source_url = url;
    checkout.address = address;
    checkout.workdir = workdir.string();
    checkout.head_commit = commit.value();
    checkout.last_fetched_at = unix_now();
    if (existing.value()) {
        checkout.referenced_by = existing.value()->referenced_by;
    }

    auto lock = FileLock::acquire(home_.checkouts_lock());
    if (lock.is_err()) return std::move(lock).error();
    auto all = load();
    if (all.is_err()) return std::move(all).error();
    auto& records = all.value();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const Checkout& c) { return c.address == address; }),
                  records.end());
    records.push_back(checkout);
    PENV_TRY(save(records));

    log::info("checked out %s at %s", url.c_str(), checkout.head_commit.substr(0, 10).c_str());
    return Result<Checkout>::ok(std::move(checkout));
}

Status CheckoutRegistry::clone_tree(const std::string& address,
                                    const std::filesystem::path& tree,
                                    const std::string& commit) {
    auto found = get(address);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) {
        return PenvError{PenvError::NotFound, "no checkout with address " + address};
    }

    auto git_lock = FileLock::acquire(address_lock(address));
    if (git_lock.is_err()) return std::move(git_lock).error();

    PENV_TRY(git_.clone_local(found.value()->workdir, tree.string()));
    PENV_TRY(git_.checkout_detached(tree.string(), commit));
    log::debug("tree %s at %s", tree.c_str(), commit.substr(0, 10).c_str());
    return ok_status();
}

Status CheckoutRegistry::move_tree(const std::string& address,
                                   const std::filesystem::path& tree,
                                   const std::string& commit) {
    auto git_lock = FileLock::acquire(address_lock(address));
    if (git_lock.is_err()) return std::move(git_lock).error();

    PENV_TRY(git_.fetch_origin(tree.string()));
    return git_.checkout_detached(tree.string(), commit);
}

Result<std::string> CheckoutRegistry::tree_commit(const std::filesystem::path& tree) {
    return git_.head_commit(tree.string());
}

Result<Checkout> CheckoutRegistry::refresh(const std::string& address) {
    auto found = get(address);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) {
        return PenvError{PenvError::NotFound, "no checkout with address " + address};
    }
    const Checkout& current = *found.value();

    auto git_lock = FileLock::acquire(address_lock(address));
    if (git_lock.is_err()) return std::move(git_lock).error();

    log::info("fetching updates for %s", current.source_url.c_str());
    PENV_TRY(git_.fetch(current.workdir));
    auto moved = git_.fast_forward(current.workdir);
    if (moved.is_err()) return std::move(moved).error();

    auto head = git_.head_commit(current.workdir);
    if (head.is_err()) return std::move(head).error();

    const std::string commit = head.value();
    return update(address, [&](Checkout& c) -> Status {
        c.head_commit = commit;
        c.last_fetched_at = unix_now();
        return ok_status();
    });
}

Status CheckoutRegistry::add_reference(const std::string& address, const std::string& alias) {
    auto updated = update(address, [&](Checkout& c) -> Status {
        c.referenced_by.insert(alias);
        return ok_status();
    });
    if (updated.is_err()) return std::move(updated).error();
    return ok_status();
}

Result<size_t> CheckoutRegistry::release_reference(const std::string& address,
                                                   const std::string& alias) {
    auto updated = update(address, [&](Checkout& c) -> Status {
        c.referenced_by.erase(alias);
        return ok_status();
    });
    if (updated.is_err()) return std::move(updated).error();
    return Result<size_t>::ok(updated.value().referenced_by.size());
}

Status CheckoutRegistry::remove(const std::string& address) {
    auto git_lock = FileLock::acquire(address_lock(address));
    if (git_lock.is_err()) return std::move(git_lock).error();
    auto lock = FileLock::acquire(home_.checkouts_lock());
    if (lock.is_err()) return std::move(lock).error();

    auto all = load();
    if (all.is_err()) return std::move(all).error();
    auto& records = all.value();
    auto it = std::find_if(records.begin(), records.end(),
                           [&](const Checkout& c) { return c.address == address; });
    if (it == records.end()) {
        return PenvError{PenvError::NotFound, "no checkout with address " + address};
    }
    if (!it->referenced_by.empty()) {
        std::string users;
        for (const auto& a : it->referenced_by) {
            if (!users.empty()) users += ", ";
            users += a;
        }
        return PenvError{PenvError::InUse,
            "checkout of " + it->source_url + " is used by: " + users,
            "delete those environments first"};
    }

    const std::filesystem::path workdir = it->workdir;
    records.erase(it);
    PENV_TRY(save(records));

    auto removed = remove_tree(workdir);
    if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    return ok_status();
}

} // namespace penv
