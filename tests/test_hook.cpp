#include "test_helpers.hpp"
#include <penv/hook.hpp>

using namespace penv;
using namespace penv::testing;

namespace {

Environment sample_environment(const std::string& root, bool include_node) {
    Environment env;
    env.alias = "dev";
    env.requirement = "^0.79";
    env.pinned = ResolvedVersion::release(Version::parse("0.79.2").value());
    env.grpc_url = "https://grpc.testnet.penumbra.zone";
    env.pd_join_url = "http://grpc.testnet.penumbra.zone:26657";
    env.include_node = include_node;
    env.root_dir = root;
    return env;
}

const EnvVar& var(const std::vector<EnvVar>& vars, const std::string& name) {
    for (const auto& v : vars) {
        if (v.name == name) return v;
    }
    FAIL("no variable " << name);
    return vars.front();
}

std::string bash(const std::string& script) {
    auto r = run_command({"bash", "-c", script});
    REQUIRE(r.is_ok());
    INFO(r.value().stderr_str);
    REQUIRE(r.value().success());
    return r.value().stdout_str;
}

} // namespace

TEST_CASE("parse_shell", "[hook]") {
    REQUIRE(parse_shell("bash").value() == Shell::Bash);
    REQUIRE(parse_shell("zsh").value() == Shell::Zsh);
    REQUIRE(parse_shell("fish").error().code == PenvError::InvalidArg);
    REQUIRE(std::string(shell_name(Shell::Zsh)) == "zsh");
}

TEST_CASE("environment_variables for a full node environment", "[hook]") {
    auto env = sample_environment("/home/u/.local/share/penv/environments/dev", true);
    auto vars = environment_variables(env);
    REQUIRE(vars.size() == 8);
    for (const auto& v : vars) REQUIRE(v.value);

    REQUIRE(*var(vars, kMarkerVariable).value == environment_fingerprint("dev", vars));
    REQUIRE(var(vars, kMarkerVariable).value->rfind("dev:", 0) == 0);
    REQUIRE(var(vars, kMarkerVariable).value->size() == 4 + kFingerprintLength);
    REQUIRE(*var(vars, "PENUMBRA_PCLI_HOME").value ==
            "/home/u/.local/share/penv/environments/dev/pcli");
    REQUIRE(*var(vars, "PENUMBRA_NODE_PD_URL").value == "https://grpc.testnet.penumbra.zone");
    REQUIRE(*var(vars, "PENUMBRA_PD_HOME").value ==
            "/home/u/.local/share/penv/environments/dev/network_data/node0/pd");
    REQUIRE(*var(vars, "COMETBFT_HOME").value ==
            "/home/u/.local/share/penv/environments/dev/network_data/node0/cometbft");
    REQUIRE(*var(vars, "PENUMBRA_PD_JOIN_URL").value == "http://grpc.testnet.penumbra.zone:26657");
    REQUIRE(*var(vars, "PENUMBRA_PD_COMETBFT_PROXY_URL").value == kCometbftProxyUrl);
}

TEST_CASE("client-only environments unset node variables", "[hook]") {
    auto vars = environment_variables(sample_environment("/envs/dev", false));
    REQUIRE(vars.size() == 8);
    REQUIRE(var(vars, "PENUMBRA_PCLI_HOME").value);
    REQUIRE_FALSE(var(vars, "PENUMBRA_PD_HOME").value);
    REQUIRE_FALSE(var(vars, "COMETBFT_HOME").value);
    REQUIRE_FALSE(var(vars, "PENUMBRA_PD_JOIN_URL").value);
    REQUIRE_FALSE(var(vars, "PENUMBRA_PD_COMETBFT_PROXY_URL").value);
}

TEST_CASE("sync_delta is empty once the shell has caught up", "[hook]") {
    auto env = sample_environment("/envs/dev", true);

    auto first = sync_delta(std::nullopt, env);
    REQUIRE(first.size() == 8);
    const std::string marker = *first[0].value;

    REQUIRE(sync_delta(marker, env).empty());
    REQUIRE(sync_delta(std::nullopt, std::nullopt).empty());

    auto switched = sync_delta(std::string("old"), env);
    REQUIRE(switched.size() == 8);

    // A bare alias from an older shell session is resynced once
    REQUIRE(sync_delta(std::string("dev"), env).size() == 8);

    auto cleared = sync_delta(marker, std::nullopt);
    REQUIRE(cleared.size() == 8);
    for (const auto& v : cleared) REQUIRE_FALSE(v.value);
}

TEST_CASE("a recreated alias with different settings is resynced", "[hook]") {
    auto before = sample_environment("/envs/dev", true);
    const std::string marker = *environment_variables(before)[0].value;

    // Same alias, other gRPC endpoint, client only
    auto after = sample_environment("/envs/dev", false);
    after.grpc_url = "https://grpc.other.example";
    auto delta = sync_delta(marker, after);
    REQUIRE(delta.size() == 8);
    REQUIRE(*var(delta, "PENUMBRA_NODE_PD_URL").value == "https://grpc.other.example");
    REQUIRE_FALSE(var(delta, "PENUMBRA_PD_HOME").value);
    REQUIRE_FALSE(var(delta, "COMETBFT_HOME").value);
    REQUIRE_FALSE(var(delta, "PENUMBRA_PD_JOIN_URL").value);

    // Only the join URL differs
    auto rejoined = sample_environment("/envs/dev", true);
    rejoined.pd_join_url = "http://other.example:26657";
    REQUIRE(sync_delta(marker, rejoined).size() == 8);

    // Identical settings under a fresh created_at need nothing
    auto same = sample_environment("/envs/dev", true);
    same.created_at = before.created_at + 60;
    REQUIRE(sync_delta(marker, same).empty());
}

TEST_CASE("render_delta output is evaluated verbatim by the shell", "[hook]") {
    auto env = sample_environment("/tmp/it's here", true);
    auto script = render_delta(Shell::Bash, environment_variables(env));
    REQUIRE(script.find("export PENUMBRA_PCLI_HOME='/tmp/it'\\''s here/pcli'\n") !=
            std::string::npos);

    auto out = bash(script + "printf '%s|%s' \"$PENUMBRA_PCLI_HOME\" \"$" +
                    std::string(kMarkerVariable) + "\"");
    REQUIRE(out == "/tmp/it's here/pcli|" + *environment_variables(env)[0].value);

    auto unset = render_delta(Shell::Bash, environment_variables(std::nullopt));
    REQUIRE(unset.find("unset PENUMBRA_PD_HOME\n") != std::string::npos);
    auto cleared = bash(script + unset + "printf '%s' \"${PENUMBRA_PCLI_HOME-none}\"");
    REQUIRE(cleared == "none");
}

TEST_CASE("bash hook prepends bin once and installs the prompt hook", "[hook]") {
    auto hook = hook_script(Shell::Bash, "'/usr/bin/penv' --home '/h'", "/h/bin");
    REQUIRE(hook.is_ok());
    REQUIRE(hook.value().find("'/usr/bin/penv' --home '/h' env bash") != std::string::npos);

    auto out = bash("PATH=/usr/bin:/bin\nPROMPT_COMMAND=\n" + hook.value() + hook.value() +
                    "printf '%s\\n%s' \"$PATH\" \"$PROMPT_COMMAND\"");
    REQUIRE(out == "/h/bin:/usr/bin:/bin\n_penv_hook");
}

TEST_CASE("zsh hook registers a precmd function", "[hook]") {
    auto hook = hook_script(Shell::Zsh, "penv", "/h/bin");
    REQUIRE(hook.is_ok());
    REQUIRE(hook.value().find("precmd_functions=(_penv_hook $precmd_functions)") !=
            std::string::npos);
    REQUIRE(hook.value().find("_penv_bin='/h/bin'") != std::string::npos);
    REQUIRE(hook.value().find("eval \"$(penv env zsh)\"") != std::string::npos);
}
