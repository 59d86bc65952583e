#include "test_helpers.hpp"
#include <penv/hook.hpp>

using namespace penv;
using namespace penv::testing;

// Release index 0.79.0, 0.79.1, 0.79.2, 0.80.0; install ^0.79, create and
// use "dev", lose the cached version, then try to use "dev" again
TEST_CASE("install, create, use, lose the version, use again", "[scenario]") {
    Workspace ws;
    for (const char* v : {"0.79.0", "0.79.1", "0.79.2", "0.80.0"}) {
        ws.source.publish(v);
    }

    auto installed = ws.penv.install("^0.79");
    REQUIRE(installed.is_ok());
    REQUIRE(installed.value().version.to_string() == "0.79.2");
    REQUIRE(ws.penv.installed().value().size() == 1);

    auto available = ws.penv.available();
    REQUIRE(available.is_ok());
    REQUIRE(available.value().size() == 4);
    REQUIRE(available.value()[0].release.version.to_string() == "0.80.0");
    REQUIRE_FALSE(available.value()[0].installed);
    REQUIRE(available.value()[1].installed);

    auto env = ws.create("dev", "^0.79");
    REQUIRE(env.pinned.to_string() == "0.79.2");

    REQUIRE(ws.penv.activation().use("dev").is_ok());
    auto which = ws.penv.activation().current();
    REQUIRE(which.is_ok());
    REQUIRE(which.value()->alias == "dev");
    REQUIRE(which.value()->pinned.to_string() == "0.79.2");

    // The shell picks the environment up once, then has nothing to do
    auto delta = sync_delta(std::nullopt, which.value());
    REQUIRE(render_delta(Shell::Bash, delta).find("export PENUMBRA_PENV_ACTIVE_ENVIRONMENT='dev:") !=
            std::string::npos);
    REQUIRE(sync_delta(*delta[0].value, which.value()).empty());

    // Deleting through the CLI path is refused while "dev" is pinned to it
    auto refused = ws.penv.remove_cached("0.79.2");
    REQUIRE(refused.is_err());
    REQUIRE(refused.error().code == PenvError::InUse);

    REQUIRE(ws.penv.cache().uninstall(Version::parse("0.79.2").value()).is_ok());

    auto again = ws.penv.activation().use("dev");
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == PenvError::VersionNotInstalled);

    auto still = ws.penv.activation().current();
    REQUIRE(still.is_ok());
    REQUIRE(still.value()->alias == "dev");
}

TEST_CASE("deleting an unused version and an unused checkout", "[scenario][git]") {
    Workspace ws;
    ws.install({"0.79.2", "0.80.0"});
    ws.create("dev", "^0.79");

    REQUIRE(ws.penv.remove_cached("=0.80.0").is_ok());
    REQUIRE(ws.penv.installed().value().size() == 1);
    REQUIRE(ws.penv.remove_cached("0.80.0").error().code == PenvError::NotFound);

    auto upstream = make_git_repo(ws.td.path / "upstream");
    REQUIRE(ws.penv.install(upstream.string()).is_ok());
    ws.create_source("src", upstream);
    REQUIRE(ws.penv.remove_cached(upstream.string()).error().code == PenvError::InUse);

    REQUIRE(ws.penv.environments().remove("src", ws.penv.activation()).is_ok());
    REQUIRE(ws.penv.remove_cached(upstream.string()).is_ok());
    REQUIRE(ws.penv.checkouts().list().value().empty());
}

TEST_CASE("requirement filters for listings", "[scenario]") {
    Workspace ws;
    ws.install({"0.79.2", "0.80.0"});

    REQUIRE(ws.penv.installed("^0.80").value().size() == 1);
    REQUIRE(ws.penv.available("^0.79").value().size() == 1);
    REQUIRE(ws.penv.available("https://github.com/penumbra-zone/penumbra.git").error().code ==
            PenvError::InvalidArg);
}

TEST_CASE("reinstalling an exact installed version needs no release listing", "[scenario]") {
    Workspace ws;
    ws.install({"0.79.2"});
    ws.penv.releases().invalidate();
    ws.source.unreachable = true;
    const int lists = ws.source.list_calls;
    const int fetches = ws.source.fetch_calls;

    auto again = ws.penv.install("=0.79.2");
    INFO((again.is_err() ? again.error().format() : ""));
    REQUIRE(again.is_ok());
    REQUIRE(again.value().version.to_string() == "0.79.2");
    REQUIRE(again.value().entry);
    REQUIRE(ws.source.list_calls == lists);
    REQUIRE(ws.source.fetch_calls == fetches);

    // A range still has to consult the release listing
    auto range = ws.penv.install("^0.79");
    REQUIRE(range.is_err());
    REQUIRE(range.error().code == PenvError::Network);

    // So does an exact version that is not in the cache
    auto missing = ws.penv.install("=0.80.0");
    REQUIRE(missing.is_err());
    REQUIRE(ws.source.list_calls > lists);
}

// delete dev, recreate it client-only against another endpoint and use it,
// all before the shell's next prompt
TEST_CASE("recreating the active alias resyncs the shell", "[scenario]") {
    Workspace ws;
    ws.install({"0.79.2"});
    ws.create("dev", "^0.79");
    REQUIRE(ws.penv.activation().use("dev").is_ok());
    auto synced = sync_delta(std::nullopt, ws.penv.activation().current().value());
    const std::string marker = *synced[0].value;

    REQUIRE(ws.penv.environments().remove("dev", ws.penv.activation()).is_ok());
    EnvironmentOptions client_only;
    client_only.include_node = false;
    auto recreated = ws.penv.environments().create("dev", "^0.79", "https://grpc.other.example",
                                                   client_only);
    REQUIRE(recreated.is_ok());
    REQUIRE(ws.penv.activation().use("dev").is_ok());

    auto delta = sync_delta(marker, ws.penv.activation().current().value());
    auto script = render_delta(Shell::Bash, delta);
    REQUIRE(script.find("export PENUMBRA_NODE_PD_URL='https://grpc.other.example'\n") !=
            std::string::npos);
    REQUIRE(script.find("unset PENUMBRA_PD_HOME\n") != std::string::npos);
    REQUIRE(script.find("unset COMETBFT_HOME\n") != std::string::npos);
    REQUIRE(script.find("unset PENUMBRA_PD_JOIN_URL\n") != std::string::npos);
}
