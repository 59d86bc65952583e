#include <penv/requirement.hpp>
#include <penv/fs.hpp>

#include <cstdlib>

namespace penv {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// user@host:path, the scp-like syntax git accepts for ssh remotes
static bool is_scp_like(const std::string& s) {
    auto at = s.find('@');
    auto colon = s.find(':');
    return at != std::string::npos && colon != std::string::npos &&
           at > 0 && colon > at + 1 && s.find('/') > colon;
}

bool looks_like_source(const std::string& s) {
    if (s.find("://") != std::string::npos) return true;
    if (is_scp_like(s)) return true;
    if (ends_with(s, ".git")) return true;
    return starts_with(s, "/") || starts_with(s, "./") ||
           starts_with(s, "../") || starts_with(s, "~/");
}

static std::string normalize_source(const std::string& s) {
    std::string out = s;
    if (starts_with(out, "~/")) {
        const char* home = std::getenv("HOME");
        if (home) out = std::string(home) + out.substr(1);
    }
    bool is_path = out.find("://") == std::string::npos && !is_scp_like(out);
    if (is_path) {
        std::error_code ec;
        auto abs = fs::absolute(out, ec);
        if (!ec) out = abs.lexically_normal().string();
    }
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

Result<Requirement> Requirement::parse(const std::string& s) {
    Requirement req;
    req.raw = s;

    if (s == "latest") {
        req.kind = Latest;
        return Result<Requirement>::ok(std::move(req));
    }

    if (looks_like_source(s)) {
        req.kind = Source;
        req.source = normalize_source(s);
        return Result<Requirement>::ok(std::move(req));
    }

    auto range = VersionReq::parse(s);
    if (range.is_err()) {
        auto err = std::move(range).error();
        err.hint = "use a semver range like '^0.79', 'latest', or a git URL";
        return err;
    }
    req.kind = Range;
    req.range = std::move(range).value();
    return Result<Requirement>::ok(std::move(req));
}

bool Requirement::accepts(const Version& v) const {
    switch (kind) {
    case Range:  return range.matches(v);
    case Latest: return !v.is_prerelease();
    case Source: return false;
    }
    return false;
}

std::optional<Version> Requirement::exact_version() const {
    if (kind != Range || range.constraints.size() != 1) return std::nullopt;
    const auto& c = range.constraints.front();
    if (c.op != ConstraintOp::Exact || c.version.minor < 0 || c.version.patch < 0) {
        return std::nullopt;
    }
    return c.version.floor();
}

// ---------------------------------------------------------------------------
// ResolvedVersion
// ---------------------------------------------------------------------------

ResolvedVersion ResolvedVersion::release(Version v) {
    ResolvedVersion rv;
    rv.kind = Release;
    rv.version = std::move(v);
    return rv;
}

ResolvedVersion ResolvedVersion::source(std::string url, std::string commit) {
    ResolvedVersion rv;
    rv.kind = Source;
    rv.url = std::move(url);
    rv.commit = std::move(commit);
    return rv;
}

Result<ResolvedVersion> ResolvedVersion::parse(const std::string& s) {
    if (starts_with(s, "git+")) {
        std::string rest = s.substr(4);
        auto hash = rest.rfind('#');
        if (hash == std::string::npos || hash == 0) {
            return PenvError{PenvError::Parse,
                "invalid pinned source '" + s + "'", "expected git+<url>#<commit>"};
        }
        return Result<ResolvedVersion>::ok(
            source(rest.substr(0, hash), rest.substr(hash + 1)));
    }

    auto v = Version::parse(s);
    if (v.is_err()) return std::move(v).error();
    return Result<ResolvedVersion>::ok(release(std::move(v).value()));
}

std::string ResolvedVersion::to_string() const {
    if (kind == Source) return "git+" + url + "#" + commit;
    return version.to_string();
}

std::string ResolvedVersion::display() const {
    if (kind == Release) return version.to_string();
    if (commit.empty()) return url;
    return url + "@" + commit.substr(0, 10);
}

bool ResolvedVersion::operator==(const ResolvedVersion& o) const {
    if (kind != o.kind) return false;
    if (kind == Release) return version == o.version && version.build == o.version.build;
    return url == o.url && commit == o.commit;
}

} // namespace penv
