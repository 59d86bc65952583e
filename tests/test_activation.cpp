#include "test_helpers.hpp"
#include <penv/activation.hpp>

using namespace penv;
using namespace penv::testing;

namespace {

size_t generation_count(const Home& home) {
    size_t n = 0;
    for (const auto& e : std::filesystem::directory_iterator(home.generations_dir())) {
        (void)e;
        ++n;
    }
    return n;
}

std::filesystem::path bin(const Workspace& ws, const char* name) {
    return ws.home.bin_link() / name;
}

} // namespace

TEST_CASE("FileActiveStateStore round trip", "[activation]") {
    TempDir td;
    FileActiveStateStore store(td.path / "active.toml");

    auto empty = store.load();
    REQUIRE(empty.is_ok());
    REQUIRE_FALSE(empty.value().alias);

    REQUIRE(store.save(ActiveState{std::string("dev")}).is_ok());
    REQUIRE(*store.load().value().alias == "dev");

    REQUIRE(store.save(ActiveState{}).is_ok());
    REQUIRE_FALSE(store.load().value().alias);
}

TEST_CASE("use links the pinned binaries", "[activation]") {
    Workspace ws;
    ws.install({"0.79.2"});
    ws.create("dev", "^0.79");

    auto used = ws.penv.activation().use("dev");
    REQUIRE(used.is_ok());
    REQUIRE(*ws.penv.activation().active_alias().value() == "dev");
    REQUIRE(std::filesystem::is_symlink(ws.home.bin_link()));
    REQUIRE(run_ok({bin(ws, "pcli").string()}) == "pcli 0.79.2");
    REQUIRE(run_ok({bin(ws, "pclientd").string()}) == "pclientd 0.79.2");
    REQUIRE(run_ok({bin(ws, "pd").string()}) == "pd 0.79.2");

    auto current = ws.penv.activation().current();
    REQUIRE(current.is_ok());
    REQUIRE(current.value()->alias == "dev");
}

TEST_CASE("client-only environments get no pd", "[activation]") {
    Workspace ws;
    ws.install({"0.79.2"});
    EnvironmentOptions options;
    options.include_node = false;
    ws.create("client", "latest", options);

    REQUIRE(ws.penv.activation().use("client").is_ok());
    REQUIRE(std::filesystem::exists(bin(ws, "pcli")));
    REQUIRE_FALSE(std::filesystem::exists(std::filesystem::symlink_status(bin(ws, "pd"))));
}

TEST_CASE("switching replaces the previous generation", "[activation]") {
    Workspace ws;
    ws.install({"0.79.0", "0.80.0"});
    ws.create("old", "=0.79.0");
    ws.create("new", "^0.80");
    auto& activation = ws.penv.activation();

    REQUIRE(activation.use("old").is_ok());
    REQUIRE(activation.use("new").is_ok());
    REQUIRE(run_ok({bin(ws, "pcli").string()}) == "pcli 0.80.0");
    REQUIRE(generation_count(ws.home) == 1);

    // Re-using the active environment is fine
    REQUIRE(activation.use("new").is_ok());
    REQUIRE(generation_count(ws.home) == 1);
}

TEST_CASE("a failed use keeps the previous environment active", "[activation]") {
    Workspace ws;
    ws.install({"0.79.0", "0.80.0"});
    ws.create("old", "=0.79.0");
    ws.create("new", "^0.80");
    auto& activation = ws.penv.activation();
    REQUIRE(activation.use("old").is_ok());
    const int saves = ws.store.save_count();

    SECTION("unknown alias") {
        auto r = activation.use("missing");
        REQUIRE(r.error().code == PenvError::UnknownAlias);
    }
    SECTION("pinned version was uninstalled") {
        REQUIRE(ws.penv.cache().uninstall(Version::parse("0.80.0").value()).is_ok());
        auto r = activation.use("new");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PenvError::VersionNotInstalled);
    }
    SECTION("cached binary was deleted") {
        auto entry = ws.penv.cache().find(Version::parse("0.80.0").value()).value();
        std::filesystem::remove(entry->binary(Binary::Pclientd)->path);
        auto r = activation.use("new");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PenvError::ActivationFailed);
    }
    SECTION("active state cannot be recorded") {
        ws.store.fail_saves(true);
        auto r = activation.use("new");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PenvError::ActivationFailed);
        ws.store.fail_saves(false);
    }

    REQUIRE(ws.store.save_count() == saves);
    REQUIRE(*activation.active_alias().value() == "old");
    REQUIRE(run_ok({bin(ws, "pcli").string()}) == "pcli 0.79.0");
    REQUIRE(generation_count(ws.home) == 1);
}

TEST_CASE("a failed first use leaves nothing behind", "[activation]") {
    Workspace ws;
    ws.install({"0.79.2"});
    ws.create("dev", "^0.79");
    ws.store.fail_saves(true);

    REQUIRE(ws.penv.activation().use("dev").is_err());
    REQUIRE_FALSE(std::filesystem::exists(std::filesystem::symlink_status(ws.home.bin_link())));
    REQUIRE(generation_count(ws.home) == 0);
}

TEST_CASE("deactivate clears the link and the state", "[activation]") {
    Workspace ws;
    ws.install({"0.79.2"});
    ws.create("dev", "^0.79");
    auto& activation = ws.penv.activation();

    // Deactivating with nothing active is a no-op
    REQUIRE(activation.deactivate().is_ok());

    REQUIRE(activation.use("dev").is_ok());
    REQUIRE(activation.deactivate().is_ok());
    REQUIRE_FALSE(activation.active_alias().value());
    REQUIRE_FALSE(activation.current().value());
    REQUIRE_FALSE(std::filesystem::exists(std::filesystem::symlink_status(ws.home.bin_link())));
    REQUIRE(generation_count(ws.home) == 0);
}

TEST_CASE("current ignores a recorded alias that no longer exists", "[activation]") {
    Workspace ws;
    REQUIRE(ws.store.save(ActiveState{std::string("ghost")}).is_ok());
    auto current = ws.penv.activation().current();
    REQUIRE(current.is_ok());
    REQUIRE_FALSE(current.value());
}

TEST_CASE("git environments link their build wrappers", "[activation][git]") {
    Workspace ws;
    auto upstream = make_git_repo(ws.td.path / "upstream");
    REQUIRE(ws.penv.install(upstream.string()).is_ok());
    auto env = ws.create_source("src", upstream);

    REQUIRE(ws.penv.activation().use("src").is_ok());
    REQUIRE(std::filesystem::read_symlink(bin(ws, "pcli")) == env.wrapper_dir() / "pcli");
    auto script = read_file(bin(ws, "pcli"));
    REQUIRE(script.is_ok());
    const std::string tree = env.source_dir().string();
    REQUIRE(script.value().rfind("#!/bin/sh\n", 0) == 0);
    REQUIRE(script.value().find(env.pinned.commit) != std::string::npos);
    REQUIRE(script.value().find("--manifest-path " + shell_quote(tree + "/Cargo.toml") +
                                " --bin pcli") != std::string::npos);
    REQUIRE(script.value().find("exec " + shell_quote(tree + "/target/release/pcli")) !=
            std::string::npos);

    auto perms = std::filesystem::status(bin(ws, "pcli")).permissions();
    REQUIRE((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);
}

TEST_CASE("a git environment whose tree left its pinned commit is not activated", "[activation][git]") {
    Workspace ws;
    auto upstream = make_git_repo(ws.td.path / "upstream");
    REQUIRE(ws.penv.install(upstream.string()).is_ok());
    auto env = ws.create_source("src", upstream);

    git_commit_file(env.source_dir(), "local.txt", "edited by hand\n");
    auto r = ws.penv.activation().use("src");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::ActivationFailed);
    REQUIRE_FALSE(ws.penv.activation().active_alias().value());
}
