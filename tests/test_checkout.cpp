#include "test_helpers.hpp"
#include <penv/checkout.hpp>

using namespace penv;
using namespace penv::testing;

TEST_CASE("content_address is stable per URL", "[checkout]") {
    auto a = content_address("https://github.com/penumbra-zone/penumbra");
    REQUIRE(a.size() == 64);
    REQUIRE(a == content_address("https://github.com/penumbra-zone/penumbra"));
    REQUIRE(a != content_address("https://github.com/penumbra-zone/penumbra.git"));
}

TEST_CASE("ensure_checkout clones once and reuses", "[checkout][git]") {
    TempDir td;
    auto home = make_home(td);
    auto upstream = make_git_repo(td.path / "upstream");
    const std::string url = upstream.string();

    CheckoutRegistry registry(home, GitCli{});
    auto first = registry.ensure_checkout(url);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().address == content_address(url));
    REQUIRE(first.value().head_commit == git_head(upstream));
    REQUIRE(std::filesystem::exists(std::filesystem::path(first.value().workdir) / "Cargo.toml"));

    // Marker survives reuse, proving no re-clone happened
    std::ofstream(std::filesystem::path(first.value().workdir) / "target-marker") << "built\n";

    auto second = registry.ensure_checkout(url);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().workdir == first.value().workdir);
    REQUIRE(std::filesystem::exists(std::filesystem::path(second.value().workdir) / "target-marker"));
    REQUIRE(registry.list().value().size() == 1);

    auto by_url = registry.find_by_url(url);
    REQUIRE(by_url.value().has_value());
    REQUIRE(by_url.value()->head_commit == first.value().head_commit);
}

TEST_CASE("ensure_checkout of a bad URL records nothing", "[checkout][git]") {
    TempDir td;
    auto home = make_home(td);
    CheckoutRegistry registry(home, GitCli{});

    auto r = registry.ensure_checkout((td.path / "no-such-repo").string());
    REQUIRE(r.is_err());
    REQUIRE(registry.list().value().empty());

    size_t leftovers = 0;
    for (const auto& e : std::filesystem::directory_iterator(home.checkouts_dir())) {
        if (e.path().extension() != ".lock") ++leftovers;
    }
    REQUIRE(leftovers == 0);
}

TEST_CASE("refresh picks up upstream commits and keeps build output", "[checkout][git]") {
    TempDir td;
    auto home = make_home(td);
    auto upstream = make_git_repo(td.path / "upstream");

    CheckoutRegistry registry(home, GitCli{});
    auto checkout = registry.ensure_checkout(upstream.string()).value();
    const auto workdir = std::filesystem::path(checkout.workdir);
    std::filesystem::create_directories(workdir / "target" / "release");
    std::ofstream(workdir / "target" / "release" / "pcli") << "cached build\n";

    git_commit_file(upstream, "README.md", "new\n");
    auto refreshed = registry.refresh(checkout.address);
    REQUIRE(refreshed.is_ok());
    REQUIRE(refreshed.value().head_commit == git_head(upstream));
    REQUIRE(refreshed.value().head_commit != checkout.head_commit);
    REQUIRE(std::filesystem::exists(workdir / "README.md"));
    REQUIRE(std::filesystem::exists(workdir / "target" / "release" / "pcli"));

    REQUIRE(registry.get(checkout.address).value()->head_commit == git_head(upstream));
}

TEST_CASE("refresh of an unknown address", "[checkout]") {
    TempDir td;
    auto home = make_home(td);
    CheckoutRegistry registry(home, GitCli{});
    auto r = registry.refresh(content_address("https://example.com/x.git"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NotFound);
}

TEST_CASE("references protect a checkout from removal", "[checkout][git]") {
    TempDir td;
    auto home = make_home(td);
    auto upstream = make_git_repo(td.path / "upstream");

    CheckoutRegistry registry(home, GitCli{});
    auto checkout = registry.ensure_checkout(upstream.string()).value();

    REQUIRE(registry.add_reference(checkout.address, "dev").is_ok());
    REQUIRE(registry.add_reference(checkout.address, "dev2").is_ok());
    REQUIRE(registry.add_reference(checkout.address, "dev").is_ok());
    REQUIRE(registry.get(checkout.address).value()->referenced_by.size() == 2);

    auto blocked = registry.remove(checkout.address);
    REQUIRE(blocked.is_err());
    REQUIRE(blocked.error().code == PenvError::InUse);
    REQUIRE(blocked.error().message.find("dev2") != std::string::npos);
    REQUIRE(std::filesystem::exists(checkout.workdir));

    REQUIRE(registry.release_reference(checkout.address, "dev").value() == 1);
    REQUIRE(registry.release_reference(checkout.address, "dev2").value() == 0);

    REQUIRE(registry.remove(checkout.address).is_ok());
    REQUIRE_FALSE(std::filesystem::exists(checkout.workdir));
    REQUIRE(registry.list().value().empty());
}

TEST_CASE("ensure_checkout re-clones a vanished working directory", "[checkout][git]") {
    TempDir td;
    auto home = make_home(td);
    auto upstream = make_git_repo(td.path / "upstream");

    CheckoutRegistry registry(home, GitCli{});
    auto checkout = registry.ensure_checkout(upstream.string()).value();
    REQUIRE(registry.add_reference(checkout.address, "dev").is_ok());
    std::filesystem::remove_all(checkout.workdir);

    auto again = registry.ensure_checkout(upstream.string());
    REQUIRE(again.is_ok());
    REQUIRE(std::filesystem::exists(std::filesystem::path(again.value().workdir) / ".git"));
    REQUIRE(again.value().referenced_by.count("dev") == 1);
    REQUIRE(registry.list().value().size() == 1);
}
