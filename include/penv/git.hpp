#pragma once

#include <penv/result.hpp>
#include <penv/version.hpp>
#include <string>
#include <vector>

namespace penv {

// A semver tag from `git ls-remote`
struct RemoteTag {
    std::string name;      // e.g. "v0.79.2"
    std::string commit;    // peeled commit for annotated tags
    Version version;
};

// Parse `git ls-remote --tags` output. Tags that are not semver (with or
// without a 'v' prefix) are skipped. Sorted highest version first.
std::vector<RemoteTag> parse_ls_remote_tags(const std::string& ls_remote_output);

// Thin wrapper over the git command line
class GitCli {
public:
    Result<std::string> ls_remote_tags(const std::string& url);

    // Full clone with a working tree
    Status clone(const std::string& url, const std::string& dest);

    // `git fetch --all --tags`; untracked files (build output) are untouched
    Status fetch(const std::string& workdir);

    // Fast-forward the checked-out branch to its upstream. Returns false
    // without error when HEAD is detached or has no upstream.
    Result<bool> fast_forward(const std::string& workdir);

    Result<std::string> head_commit(const std::string& workdir);

    // Clone a local repository without populating the working tree.
    // Objects are hardlinked where the filesystem allows.
    Status clone_local(const std::string& source_dir, const std::string& dest);

    // Fetch from the `origin` of a clone made by clone_local
    Status fetch_origin(const std::string& workdir);

    // Point HEAD at `commit` (detached) and update the working tree
    Status checkout_detached(const std::string& workdir, const std::string& commit);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    Status require_online(const char* what) const;

    int timeout_seconds_ = 300;
    bool offline_ = false;
};

} // namespace penv
