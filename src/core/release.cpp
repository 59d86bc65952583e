#include <penv/release.hpp>
#include <penv/log.hpp>
#include <penv/resolver.hpp>

#include <algorithm>

namespace penv {

const ReleaseAsset* Release::asset(Binary b) const {
    for (const auto& a : assets) {
        if (a.binary == b) return &a;
    }
    return nullptr;
}

Release make_release(const Version& version, const std::string& tag,
                     const std::string& download_base, const std::string& platform) {
    Release r;
    r.version = version;
    r.tag = tag;
    for (Binary b : kAllBinaries) {
        ReleaseAsset a;
        a.binary = b;
        a.archive_url = download_base + "/" + tag + "/" + binary_name(b) + "-" +
                        platform + ".tar.gz";
        a.checksum_url = a.archive_url + ".sha256";
        r.assets.push_back(std::move(a));
    }
    return r;
}

// ---------------------------------------------------------------------------
// GitTagReleaseSource
// ---------------------------------------------------------------------------

GitTagReleaseSource::GitTagReleaseSource(const Config& config, Fetcher& fetcher)
    : repository_(config.repository),
      download_base_(config.effective_download_base()),
      platform_(config.effective_platform()),
      fetcher_(fetcher) {
    git_.set_timeout(config.network.timeout_seconds);
    git_.set_offline(config.network.offline);
}

Result<std::vector<Release>> GitTagReleaseSource::list_releases() {
    auto out = git_.ls_remote_tags(repository_);
    if (out.is_err()) return std::move(out).error();

    std::vector<Release> releases;
    for (const auto& tag : parse_ls_remote_tags(out.value())) {
        releases.push_back(make_release(tag.version, tag.name, download_base_, platform_));
    }
    log::debug("%zu releases published in %s", releases.size(), repository_.c_str());
    return Result<std::vector<Release>>::ok(std::move(releases));
}

Status GitTagReleaseSource::fetch(const std::string& url, const std::filesystem::path& dest) {
    return fetcher_.fetch(url, dest);
}

// ---------------------------------------------------------------------------
// ReleaseIndex
// ---------------------------------------------------------------------------

Result<std::vector<Release>> ReleaseIndex::releases() {
    if (!cached_) {
        auto listed = source_.list_releases();
        if (listed.is_err()) return std::move(listed).error();
        auto all = std::move(listed).value();
        std::sort(all.begin(), all.end(),
                  [](const Release& a, const Release& b) { return a.version > b.version; });
        cached_ = std::move(all);
    }
    return Result<std::vector<Release>>::ok(*cached_);
}

Result<std::vector<Version>> ReleaseIndex::versions() {
    auto all = releases();
    if (all.is_err()) return std::move(all).error();

    std::vector<Version> out;
    out.reserve(all.value().size());
    for (const auto& r : all.value()) out.push_back(r.version);
    return Result<std::vector<Version>>::ok(std::move(out));
}

Result<Release> ReleaseIndex::find(const Version& v) {
    auto all = releases();
    if (all.is_err()) return std::move(all).error();

    for (const auto& r : all.value()) {
        if (r.version == v) return Result<Release>::ok(r);
    }
    return PenvError{PenvError::NotFound, "no published release " + v.to_string()};
}

Result<Release> ReleaseIndex::resolve(const Requirement& req) {
    if (req.is_source()) {
        return PenvError{PenvError::InvalidArg,
            "'" + req.to_string() + "' is a git source, not a release requirement"};
    }

    auto candidates = versions();
    if (candidates.is_err()) return std::move(candidates).error();

    auto resolved = penv::resolve(req, candidates.value());
    if (resolved.is_err()) {
        auto err = std::move(resolved).error();
        if (err.code == PenvError::NoReleases) {
            err.message = "the release index is empty";
            err.hint = "check the repository setting and network access";
        }
        return err;
    }
    return find(resolved.value().version);
}

Result<std::vector<Release>> ReleaseIndex::matching(const std::optional<Requirement>& req) {
    auto all = releases();
    if (all.is_err()) return std::move(all).error();
    if (!req) return all;

    std::vector<Release> out;
    for (const auto& r : all.value()) {
        if (req->accepts(r.version)) out.push_back(r);
    }
    return Result<std::vector<Release>>::ok(std::move(out));
}

} // namespace penv
