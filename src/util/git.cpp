#include <penv/git.hpp>
#include <penv/log.hpp>
#include <penv/process.hpp>

#include <algorithm>
#include <map>
#include <sstream>

namespace penv {

std::vector<RemoteTag> parse_ls_remote_tags(const std::string& ls_remote_output) {
    // "<sha>\trefs/tags/<name>", annotated tags add "<sha>\trefs/tags/<name>^{}"
    // whose sha is the commit the tag points at.
    const std::string prefix = "refs/tags/";
    const std::string peeled = "^{}";

    std::map<std::string, std::string> commit_of;
    std::istringstream stream(ls_remote_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;

        std::string sha = line.substr(0, tab);
        std::string ref = line.substr(tab + 1);
        if (ref.compare(0, prefix.size(), prefix) != 0) continue;

        std::string name = ref.substr(prefix.size());
        bool is_peeled = name.size() > peeled.size() &&
            name.compare(name.size() - peeled.size(), peeled.size(), peeled) == 0;
        if (is_peeled) {
            name.resize(name.size() - peeled.size());
            commit_of[name] = sha;
        } else {
            commit_of.emplace(name, sha);
        }
    }

    std::vector<RemoteTag> tags;
    for (const auto& [name, sha] : commit_of) {
        auto ver = Version::parse(name);
        if (ver.is_err()) {
            log::trace("skipping non-semver tag '%s'", name.c_str());
            continue;
        }
        tags.push_back(RemoteTag{name, sha, std::move(ver).value()});
    }

    std::sort(tags.begin(), tags.end(),
              [](const RemoteTag& a, const RemoteTag& b) { return a.version > b.version; });
    return tags;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Status GitCli::require_online(const char* what) const {
    if (offline_) {
        return PenvError{PenvError::Network,
            std::string("cannot ") + what + " in offline mode",
            "set network.offline = false in config.toml"};
    }
    return ok_status();
}

static Result<CommandResult> run_git(const std::vector<std::string>& args, int timeout) {
    log::debug("%s", describe_command(args).c_str());
    auto r = run_command(args, "", timeout);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code == 127) {
        return PenvError{PenvError::NotFound,
            "could not execute git", "install git and make sure it is on PATH"};
    }
    return r;
}

Result<std::string> GitCli::ls_remote_tags(const std::string& url) {
    PENV_TRY(require_online("list remote tags"));

    auto r = run_git({"git", "ls-remote", "--tags", url}, timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::Network,
            "git ls-remote " + url + " failed: " + r.value().stderr_str};
    }
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

Status GitCli::clone(const std::string& url, const std::string& dest) {
    PENV_TRY(require_online("clone"));

    auto r = run_git({"git", "clone", "--quiet", url, dest}, timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::Network,
            "git clone " + url + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::fetch(const std::string& workdir) {
    PENV_TRY(require_online("fetch"));

    auto r = run_git({"git", "-C", workdir, "fetch", "--quiet", "--all", "--tags"},
                     timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::Network,
            "git fetch in " + workdir + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

// Local operations below never leave the machine, so offline mode allows them

Status GitCli::clone_local(const std::string& source_dir, const std::string& dest) {
    auto r = run_git({"git", "clone", "--quiet", "--no-checkout", source_dir, dest},
                     timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::IO,
            "git clone " + source_dir + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::fetch_origin(const std::string& workdir) {
    auto r = run_git({"git", "-C", workdir, "fetch", "--quiet", "--tags", "origin"},
                     timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::IO,
            "git fetch origin in " + workdir + " failed: " + r.value().stderr_str};
    }
    return ok_status();
}

Status GitCli::checkout_detached(const std::string& workdir, const std::string& commit) {
    auto r = run_git({"git", "-C", workdir, "checkout", "--quiet", "--detach", commit},
                     timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::NotFound,
            "cannot check out " + commit + " in " + workdir + ": " + r.value().stderr_str};
    }
    return ok_status();
}

Result<bool> GitCli::fast_forward(const std::string& workdir) {
    auto upstream = run_git({"git", "-C", workdir, "rev-parse", "--abbrev-ref",
                             "--symbolic-full-name", "@{u}"}, timeout_seconds_);
    if (upstream.is_err()) return std::move(upstream).error();
    if (!upstream.value().success()) {
        log::debug("%s has no upstream branch, not fast-forwarding", workdir.c_str());
        return Result<bool>::ok(false);
    }

    auto r = run_git({"git", "-C", workdir, "merge", "--ff-only", "--quiet", "@{u}"},
                     timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::IO,
            "cannot fast-forward " + workdir + ": " + r.value().stderr_str,
            "the checkout has diverged from " + upstream.value().stdout_line()};
    }
    return Result<bool>::ok(true);
}

Result<std::string> GitCli::head_commit(const std::string& workdir) {
    auto r = run_git({"git", "-C", workdir, "rev-parse", "HEAD"}, timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (!r.value().success()) {
        return PenvError{PenvError::NotFound,
            "cannot resolve HEAD in " + workdir + ": " + r.value().stderr_str};
    }
    return Result<std::string>::ok(r.value().stdout_line());
}

} // namespace penv
