#pragma once

#include <penv/binary.hpp>
#include <penv/config.hpp>
#include <penv/fetch.hpp>
#include <penv/git.hpp>
#include <penv/requirement.hpp>
#include <penv/result.hpp>
#include <penv/version.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace penv {

struct ReleaseAsset {
    Binary binary;
    std::string archive_url;   // <binary>-<platform>.tar.gz
    std::string checksum_url;  // <archive_url>.sha256
};

// Published release metadata. Only lives for the current process.
struct Release {
    Version version;
    std::string tag;
    std::vector<ReleaseAsset> assets;

    const ReleaseAsset* asset(Binary b) const;
};

// Release for `tag` following the upstream asset naming convention
Release make_release(const Version& version, const std::string& tag,
                     const std::string& download_base, const std::string& platform);

// Where releases come from, and how their assets are downloaded
class ReleaseSource {
public:
    virtual ~ReleaseSource() = default;

    virtual Result<std::vector<Release>> list_releases() = 0;
    virtual Status fetch(const std::string& url, const std::filesystem::path& dest) = 0;
};

// Releases are the semver tags of the upstream git repository; assets
// are downloaded from <download_base>/<tag>/.
class GitTagReleaseSource : public ReleaseSource {
public:
    GitTagReleaseSource(const Config& config, Fetcher& fetcher);

    Result<std::vector<Release>> list_releases() override;
    Status fetch(const std::string& url, const std::filesystem::path& dest) override;

private:
    std::string repository_;
    std::string download_base_;
    std::string platform_;
    GitCli git_;
    Fetcher& fetcher_;
};

// Process-lifetime view over a ReleaseSource. The listing is fetched on
// first use and reused afterwards.
class ReleaseIndex {
public:
    explicit ReleaseIndex(ReleaseSource& source) : source_(source) {}

    Result<std::vector<Release>> releases();
    Result<std::vector<Version>> versions();

    // Highest release satisfying a Range or Latest requirement
    Result<Release> resolve(const Requirement& req);
    Result<Release> find(const Version& v);

    // Releases satisfying `req` (all when empty), highest first
    Result<std::vector<Release>> matching(const std::optional<Requirement>& req);

    void invalidate() { cached_.reset(); }
    ReleaseSource& source() { return source_; }

private:
    ReleaseSource& source_;
    std::optional<std::vector<Release>> cached_;
};

} // namespace penv
