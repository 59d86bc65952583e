#include "test_helpers.hpp"
#include <penv/git.hpp>

using namespace penv;
using namespace penv::testing;

// ===== parse_ls_remote_tags() =====

TEST_CASE("parse empty ls-remote output", "[git]") {
    REQUIRE(parse_ls_remote_tags("").empty());
}

TEST_CASE("parse ls-remote lightweight tags sorted descending", "[git]") {
    auto tags = parse_ls_remote_tags(
        "aaa1111111111111111111111111111111111111\trefs/tags/v0.79.0\n"
        "bbb2222222222222222222222222222222222222\trefs/tags/v0.80.0\n"
        "ccc3333333333333333333333333333333333333\trefs/tags/v0.79.2\n");
    REQUIRE(tags.size() == 3);
    REQUIRE(tags[0].name == "v0.80.0");
    REQUIRE(tags[1].version.to_string() == "0.79.2");
    REQUIRE(tags[2].commit == "aaa1111111111111111111111111111111111111");
}

TEST_CASE("parse ls-remote prefers the peeled commit", "[git]") {
    auto tags = parse_ls_remote_tags(
        "tag_object_sha\trefs/tags/v1.0.0\n"
        "commit_sha\trefs/tags/v1.0.0^{}\n");
    REQUIRE(tags.size() == 1);
    REQUIRE(tags[0].commit == "commit_sha");
    REQUIRE(tags[0].name == "v1.0.0");
}

TEST_CASE("parse ls-remote skips non-semver and non-tag refs", "[git]") {
    auto tags = parse_ls_remote_tags(
        "a\trefs/tags/v1.0.0\r\n"
        "b\trefs/tags/testnet-deploy\n"
        "c\trefs/heads/main\n"
        "garbage line\n"
        "d\trefs/tags/2.3.4\n");
    REQUIRE(tags.size() == 2);
    REQUIRE(tags[0].name == "2.3.4");
    REQUIRE(tags[1].name == "v1.0.0");
}

// ===== GitCli against local repositories =====

TEST_CASE("ls_remote_tags of a local repository", "[git]") {
    TempDir td;
    auto repo = make_git_repo(td.path / "upstream");
    run_ok({"git", "tag", "v0.79.0"}, repo.string());
    run_ok({"git", "-c", "user.name=penv", "-c", "user.email=penv@example.com",
            "tag", "-a", "v0.79.1", "-m", "release"}, repo.string());

    GitCli git;
    auto out = git.ls_remote_tags(repo.string());
    REQUIRE(out.is_ok());
    auto tags = parse_ls_remote_tags(out.value());
    REQUIRE(tags.size() == 2);
    REQUIRE(tags[0].name == "v0.79.1");
    REQUIRE(tags[0].commit == git_head(repo));
}

TEST_CASE("clone, fetch and fast-forward", "[git]") {
    TempDir td;
    auto repo = make_git_repo(td.path / "upstream");
    const auto clone_dir = td.path / "clone";

    GitCli git;
    REQUIRE(git.clone(repo.string(), clone_dir.string()).is_ok());
    REQUIRE(git.head_commit(clone_dir.string()).value() == git_head(repo));

    git_commit_file(repo, "README", "new\n");
    td.write_file("clone/target/release/pcli", "build output");

    REQUIRE(git.fetch(clone_dir.string()).is_ok());
    auto moved = git.fast_forward(clone_dir.string());
    REQUIRE(moved.is_ok());
    REQUIRE(moved.value());
    REQUIRE(git.head_commit(clone_dir.string()).value() == git_head(repo));
    REQUIRE(std::filesystem::exists(clone_dir / "target" / "release" / "pcli"));
}

TEST_CASE("fast_forward without upstream is a no-op", "[git]") {
    TempDir td;
    auto repo = make_git_repo(td.path / "solo");
    GitCli git;
    auto moved = git.fast_forward(repo.string());
    REQUIRE(moved.is_ok());
    REQUIRE_FALSE(moved.value());
}

TEST_CASE("clone of a missing repository fails", "[git]") {
    TempDir td;
    GitCli git;
    auto r = git.clone((td.path / "nope").string(), (td.path / "dest").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::Network);
}

TEST_CASE("offline mode refuses network operations", "[git]") {
    GitCli git;
    git.set_offline(true);
    REQUIRE(git.is_offline());
    auto r = git.ls_remote_tags("https://github.com/penumbra-zone/penumbra");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::Network);
    REQUIRE(git.clone("https://example.com/x.git", "/tmp/x").is_err());
}

TEST_CASE("head_commit outside a repository", "[git]") {
    TempDir td;
    GitCli git;
    auto r = git.head_commit(td.path.string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NotFound);
}

TEST_CASE("local clone pinned to a commit, then moved forward", "[git]") {
    TempDir td;
    auto repo = make_git_repo(td.path / "shared");
    const std::string first = git_head(repo);
    git_commit_file(repo, "README", "second\n");
    const std::string second = git_head(repo);

    // Offline mode does not stop local clones
    GitCli git;
    git.set_offline(true);
    const auto tree = td.path / "env" / "checkout";
    REQUIRE(git.clone_local(repo.string(), tree.string()).is_ok());
    REQUIRE(git.checkout_detached(tree.string(), first).is_ok());
    REQUIRE(git.head_commit(tree.string()).value() == first);
    REQUIRE(std::filesystem::exists(tree / "Cargo.toml"));
    REQUIRE_FALSE(std::filesystem::exists(tree / "README"));

    git_commit_file(repo, "README", "third\n");
    const std::string third = git_head(repo);
    REQUIRE(git.fetch_origin(tree.string()).is_ok());
    REQUIRE(git.checkout_detached(tree.string(), third).is_ok());
    REQUIRE(git.head_commit(tree.string()).value() == third);
    REQUIRE(read_file(tree / "README").value() == "third\n");
    REQUIRE(second != third);
}

TEST_CASE("checkout_detached of an unknown commit", "[git]") {
    TempDir td;
    auto repo = make_git_repo(td.path / "repo");
    GitCli git;
    auto r = git.checkout_detached(repo.string(), std::string(40, 'f'));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NotFound);
}
