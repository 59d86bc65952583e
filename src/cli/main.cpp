#include <CLI/CLI.hpp>

#include <penv/activation.hpp>
#include <penv/config.hpp>
#include <penv/fetch.hpp>
#include <penv/home.hpp>
#include <penv/hook.hpp>
#include <penv/log.hpp>
#include <penv/penv.hpp>
#include <penv/process.hpp>
#include <penv/release.hpp>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <optional>


#ifndef PENV_VERSION
#define PENV_VERSION "0.0.0"
#endif

using namespace penv;

namespace {

struct GlobalOptions {
    std::string home;
    bool verbose = false;
    bool quiet = false;
    bool offline = false;
};

// Everything one invocation needs, built after argument parsing
struct Session {
    Home home;
    Config config;
    std::unique_ptr<CurlFetcher> fetcher;
    std::unique_ptr<GitTagReleaseSource> source;
    std::unique_ptr<FileActiveStateStore> store;
    std::unique_ptr<Penv> penv;
};

int report(const PenvError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return 1;
}

Result<std::unique_ptr<Session>> start(const GlobalOptions& opts, bool open_cache = true) {
    auto home = Home::locate(opts.home);
    if (home.is_err()) return std::move(home).error();

    auto config = Config::load(home.value().config_file());
    if (config.is_err()) return std::move(config).error();

    // Command-line flags are the top configuration layer
    Config flags;
    if (opts.verbose || opts.quiet) {
        flags.log_level = opts.verbose ? log::Debug : log::Error;
        flags.log_level_set = true;
    }
    if (opts.offline) {
        flags.network.offline = true;
        flags.offline_set = true;
    }
    config.value().merge(flags);
    log::set_level(config.value().log_level);

    auto s = std::make_unique<Session>();
    s->home = home.value();
    s->config = config.value();
    s->fetcher = std::make_unique<CurlFetcher>(s->config.network);
    s->source = std::make_unique<GitTagReleaseSource>(s->config, *s->fetcher);
    s->store = std::make_unique<FileActiveStateStore>(s->home.active_file());
    s->penv = std::make_unique<Penv>(s->home, s->config, *s->source, *s->store);
    if (open_cache) PENV_TRY(s->penv->open());
    return Result<std::unique_ptr<Session>>::ok(std::move(s));
}

std::string format_time(int64_t t) {
    char buf[32];
    std::time_t tt = static_cast<std::time_t>(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

void print_environment(const Environment& env, bool active) {
    std::printf("%s%s\n", env.alias.c_str(), active ? " (active)" : "");
    std::printf("  requirement:   %s\n", env.requirement.c_str());
    std::printf("  pinned:        %s\n", env.pinned.display().c_str());
    std::printf("  grpc url:      %s\n", env.grpc_url.c_str());
    if (env.pinned.is_source()) {
        std::printf("  source tree:   %s\n", env.source_dir().c_str());
    }
    if (env.include_node) {
        if (env.generate_network) {
            std::printf("  network:       generated locally\n");
        } else {
            std::printf("  pd join url:   %s\n", env.pd_join_url.c_str());
        }
        std::printf("  pd home:       %s\n", env.pd_home().c_str());
        std::printf("  cometbft home: %s\n", env.cometbft_home().c_str());
    } else {
        std::printf("  client only\n");
    }
    std::printf("  pcli home:     %s\n", env.pcli_home().c_str());
    std::printf("  pclientd home: %s\n", env.pclientd_home().c_str());
    std::printf("  created:       %s\n", format_time(env.created_at).c_str());
}

std::string self_executable(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) return exe.string();
    return argv0;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_install(const GlobalOptions& opts, const std::string& requirement) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto outcome = s.value()->penv->install(requirement);
    if (outcome.is_err()) return report(outcome.error());

    if (outcome.value().checkout) {
        std::printf("checked out %s in %s\n", outcome.value().version.display().c_str(),
                    outcome.value().checkout->workdir.c_str());
    } else {
        std::printf("installed %s in %s\n", outcome.value().version.display().c_str(),
                    outcome.value().entry->root_dir.c_str());
    }
    return 0;
}

int cmd_cache_available(const GlobalOptions& opts, const std::string& requirement) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto releases = s.value()->penv->available(requirement);
    if (releases.is_err()) return report(releases.error());
    for (const auto& r : releases.value()) {
        std::printf("%-12s %s\n", r.release.version.to_string().c_str(),
                    r.installed ? "installed" : "");
    }
    return 0;
}

int cmd_cache_list(const GlobalOptions& opts, const std::string& requirement) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());
    auto& p = *s.value()->penv;

    auto entries = p.installed(requirement);
    if (entries.is_err()) return report(entries.error());
    for (const auto& e : entries.value()) {
        std::printf("%-12s %s  %s\n", e.version.to_string().c_str(),
                    format_time(e.installed_at).c_str(), e.root_dir.c_str());
    }

    if (requirement.empty()) {
        auto checkouts = p.checkouts().list();
        if (checkouts.is_err()) return report(checkouts.error());
        for (const auto& c : checkouts.value()) {
            std::printf("%s@%s  %s\n", c.source_url.c_str(),
                        c.head_commit.substr(0, 10).c_str(), c.workdir.c_str());
        }
    }
    return 0;
}

int cmd_cache_delete(const GlobalOptions& opts, const std::string& target) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto removed = s.value()->penv->remove_cached(target);
    if (removed.is_err()) return report(removed.error());
    return 0;
}

int cmd_manage_create(const GlobalOptions& opts, const std::string& alias,
                      const std::string& requirement, const std::string& grpc_url,
                      const EnvironmentOptions& options) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto env = s.value()->penv->environments().create(alias, requirement, grpc_url, options);
    if (env.is_err()) return report(env.error());
    std::printf("created environment '%s' pinned to %s\n", env.value().alias.c_str(),
                env.value().pinned.display().c_str());
    return 0;
}

int cmd_manage_list(const GlobalOptions& opts, bool detailed) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());
    auto& p = *s.value()->penv;

    auto envs = p.environments().list();
    if (envs.is_err()) return report(envs.error());
    auto active = p.activation().active_alias();
    if (active.is_err()) return report(active.error());

    for (const auto& env : envs.value()) {
        bool is_active = active.value() && *active.value() == env.alias;
        if (detailed) {
            print_environment(env, is_active);
        } else {
            std::printf("%c %-20s %s\n", is_active ? '*' : ' ', env.alias.c_str(),
                        env.pinned.display().c_str());
        }
    }
    return 0;
}

int cmd_manage_info(const GlobalOptions& opts, const std::string& alias) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());
    auto& p = *s.value()->penv;

    auto env = p.environments().get(alias);
    if (env.is_err()) return report(env.error());
    auto active = p.activation().active_alias();
    if (active.is_err()) return report(active.error());
    print_environment(env.value(), active.value() && *active.value() == alias);
    return 0;
}

int cmd_manage_upgrade(const GlobalOptions& opts, const std::string& alias) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());
    auto& p = *s.value()->penv;

    auto outcome = p.environments().upgrade(alias, p.activation());
    if (outcome.is_err()) return report(outcome.error());
    if (outcome.value().changed) {
        std::printf("upgraded '%s' from %s to %s\n", alias.c_str(),
                    outcome.value().previous.display().c_str(),
                    outcome.value().environment.pinned.display().c_str());
    } else {
        std::printf("'%s' is already at the latest installed version (%s)\n", alias.c_str(),
                    outcome.value().environment.pinned.display().c_str());
    }
    return 0;
}

int cmd_manage_delete(const GlobalOptions& opts, const std::string& alias) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());
    auto& p = *s.value()->penv;

    auto removed = p.environments().remove(alias, p.activation());
    if (removed.is_err()) return report(removed.error());
    return 0;
}

int cmd_use(const GlobalOptions& opts, const std::string& alias) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto env = s.value()->penv->activation().use(alias);
    if (env.is_err()) return report(env.error());
    std::printf("using '%s' (%s)\n", env.value().alias.c_str(),
                env.value().pinned.display().c_str());
    return 0;
}

int cmd_deactivate(const GlobalOptions& opts) {
    auto s = start(opts);
    if (s.is_err()) return report(s.error());

    auto done = s.value()->penv->activation().deactivate();
    if (done.is_err()) return report(done.error());
    return 0;
}

int cmd_which(const GlobalOptions& opts, bool detailed) {
    auto s = start(opts, false);
    if (s.is_err()) return report(s.error());

    auto env = s.value()->penv->activation().current();
    if (env.is_err()) return report(env.error());
    if (!env.value()) {
        std::printf("no active environment\n");
        return 0;
    }
    if (detailed) {
        print_environment(*env.value(), true);
    } else {
        std::printf("%s %s\n", env.value()->alias.c_str(),
                    env.value()->pinned.display().c_str());
    }
    return 0;
}

int cmd_hook(const GlobalOptions& opts, const std::string& shell_name_arg, const char* argv0) {
    auto shell = parse_shell(shell_name_arg);
    if (shell.is_err()) return report(shell.error());
    auto home = Home::locate(opts.home);
    if (home.is_err()) return report(home.error());

    std::string command = shell_quote(self_executable(argv0)) +
                          " --home " + shell_quote(home.value().root.string());
    auto script = hook_script(shell.value(), command, home.value().bin_link());
    if (script.is_err()) return report(script.error());
    std::fputs(script.value().c_str(), stdout);
    return 0;
}

// Runs before every prompt: local reads only, nothing but export/unset on stdout
// An empty --marker means the shell has nothing exported
int cmd_env(GlobalOptions opts, const std::string& shell_name_arg,
            const std::optional<std::string>& marker_flag) {
    auto shell = parse_shell(shell_name_arg);
    if (shell.is_err()) return report(shell.error());

    opts.verbose = false;
    opts.quiet = true;
    auto s = start(opts, false);
    if (s.is_err()) return report(s.error());

    std::optional<std::string> marker;
    if (marker_flag) {
        if (!marker_flag->empty()) marker = *marker_flag;
    } else if (const char* exported = std::getenv(kMarkerVariable)) {
        if (*exported) marker = std::string(exported);
    }

    auto env = s.value()->penv->activation().current();
    if (env.is_err()) return report(env.error());

    std::fputs(render_delta(shell.value(), sync_delta(marker, env.value())).c_str(), stdout);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"penv - manage Penumbra installations and environments"};
    app.set_version_flag("-V,--version", PENV_VERSION);
    app.require_subcommand(1);

    GlobalOptions opts;
    int exit_code = 0;

    app.add_option("--home", opts.home, "penv home directory");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Only log errors");
    app.add_flag("--offline", opts.offline, "Never touch the network");

    // install
    std::string install_req;
    auto* install_cmd = app.add_subcommand("install", "Install a release or check out a git source");
    install_cmd->add_option("requirement", install_req, "Version requirement or git URL")->required();
    install_cmd->callback([&]() { exit_code = cmd_install(opts, install_req); });

    // cache
    auto* cache_cmd = app.add_subcommand("cache", "Inspect and prune installed versions");
    cache_cmd->require_subcommand(1);

    std::string available_req;
    auto* available_cmd = cache_cmd->add_subcommand("available", "List published releases");
    available_cmd->add_option("requirement", available_req, "Filter by requirement");
    available_cmd->callback([&]() { exit_code = cmd_cache_available(opts, available_req); });

    std::string list_req;
    auto* cache_list_cmd = cache_cmd->add_subcommand("list", "List installed versions and checkouts");
    cache_list_cmd->add_option("requirement", list_req, "Filter by requirement");
    cache_list_cmd->callback([&]() { exit_code = cmd_cache_list(opts, list_req); });

    std::string delete_target;
    auto* cache_delete_cmd = cache_cmd->add_subcommand("delete", "Remove an installed version or checkout");
    cache_delete_cmd->add_option("target", delete_target, "Version or git URL")->required();
    cache_delete_cmd->callback([&]() { exit_code = cmd_cache_delete(opts, delete_target); });

    // manage
    auto* manage_cmd = app.add_subcommand("manage", "Create and maintain environments");
    manage_cmd->require_subcommand(1);

    std::string create_alias, create_req, create_grpc;
    EnvironmentOptions create_opts;
    bool client_only = false;
    bool no_init = false;
    auto* create_cmd = manage_cmd->add_subcommand("create", "Create an environment");
    create_cmd->add_option("alias", create_alias, "Environment name")->required();
    create_cmd->add_option("requirement", create_req, "Version requirement or git URL")->required();
    create_cmd->add_option("grpc-url", create_grpc, "pd gRPC endpoint")->required();
    create_cmd->add_option("--pd-join-url", create_opts.pd_join_url, "Node to join (default: derived from the gRPC URL)");
    create_cmd->add_flag("--client-only", client_only, "Do not set up a node");
    create_cmd->add_flag("--generate-network", create_opts.generate_network, "Have pd generate a local network instead of joining one");
    create_cmd->add_flag("--no-init", no_init, "Lay out the environment without running pcli/pclientd/pd init");
    create_cmd->callback([&]() {
        create_opts.include_node = !client_only;
        create_opts.initialize = !no_init;
        exit_code = cmd_manage_create(opts, create_alias, create_req, create_grpc, create_opts);
    });

    bool list_detailed = false;
    auto* manage_list_cmd = manage_cmd->add_subcommand("list", "List environments");
    manage_list_cmd->add_flag("--detailed", list_detailed, "Show every field");
    manage_list_cmd->callback([&]() { exit_code = cmd_manage_list(opts, list_detailed); });

    std::string info_alias;
    auto* info_cmd = manage_cmd->add_subcommand("info", "Show one environment");
    info_cmd->add_option("alias", info_alias, "Environment name")->required();
    info_cmd->callback([&]() { exit_code = cmd_manage_info(opts, info_alias); });

    std::string upgrade_alias;
    auto* upgrade_cmd = manage_cmd->add_subcommand("upgrade", "Repin to the newest installed match");
    upgrade_cmd->add_option("alias", upgrade_alias, "Environment name")->required();
    upgrade_cmd->callback([&]() { exit_code = cmd_manage_upgrade(opts, upgrade_alias); });

    std::string delete_alias;
    auto* manage_delete_cmd = manage_cmd->add_subcommand("delete", "Delete an environment");
    manage_delete_cmd->add_option("alias", delete_alias, "Environment name")->required();
    manage_delete_cmd->callback([&]() { exit_code = cmd_manage_delete(opts, delete_alias); });

    // activation
    std::string use_alias;
    auto* use_cmd = app.add_subcommand("use", "Activate an environment");
    use_cmd->add_option("alias", use_alias, "Environment name")->required();
    use_cmd->callback([&]() { exit_code = cmd_use(opts, use_alias); });

    auto* deactivate_cmd = app.add_subcommand("deactivate", "Deactivate the active environment");
    deactivate_cmd->callback([&]() { exit_code = cmd_deactivate(opts); });

    bool which_detailed = false;
    auto* which_cmd = app.add_subcommand("which", "Show the active environment");
    which_cmd->add_flag("--detailed", which_detailed, "Show every field");
    which_cmd->callback([&]() { exit_code = cmd_which(opts, which_detailed); });

    // shell integration
    std::string hook_shell;
    auto* hook_cmd = app.add_subcommand("hook", "Print the shell integration script");
    hook_cmd->add_option("shell", hook_shell, "bash or zsh")->required();
    hook_cmd->callback([&]() { exit_code = cmd_hook(opts, hook_shell, argv[0]); });

    std::string env_shell;
    std::string env_marker;
    auto* env_cmd = app.add_subcommand("env", "Print variable changes for the prompt hook");
    env_cmd->add_option("shell", env_shell, "bash or zsh")->required();
    auto* marker_opt = env_cmd->add_option("--marker", env_marker, "Marker value the shell last synced to");
    env_cmd->callback([&]() {
        std::optional<std::string> marker;
        if (marker_opt->count() > 0) marker = env_marker;
        exit_code = cmd_env(opts, env_shell, marker);
    });

    CLI11_PARSE(app, argc, argv);
    return exit_code;
}
