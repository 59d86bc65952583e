#pragma once

#include <penv/result.hpp>
#include <penv/version.hpp>
#include <optional>
#include <string>

namespace penv {

// True when the string names a git source rather than a version range:
// scheme://..., git@host:path, a filesystem path, or anything ending in .git
bool looks_like_source(const std::string& s);

// What the user asked for: a semver range, "latest", or a git source
struct Requirement {
    enum Kind { Range, Latest, Source };

    Kind kind = Range;
    VersionReq range;     // Range only
    std::string source;   // Source only; local paths are made absolute
    std::string raw;      // as given by the user

    static Result<Requirement> parse(const std::string& s);

    bool is_source() const { return kind == Source; }
    bool accepts(const Version& v) const;
    // The one version a full "=x.y.z" names; nullopt for anything wider
    std::optional<Version> exact_version() const;
    const std::string& to_string() const { return raw; }
};

// A concrete, pinned version: a release, or a git source at a commit.
// Persisted as "0.79.2" or "git+<url>#<commit>".
struct ResolvedVersion {
    enum Kind { Release, Source };

    Kind kind = Release;
    Version version;      // Release only
    std::string url;      // Source only
    std::string commit;   // Source only; empty until checked out

    static ResolvedVersion release(Version v);
    static ResolvedVersion source(std::string url, std::string commit);
    static Result<ResolvedVersion> parse(const std::string& s);

    bool is_source() const { return kind == Source; }
    std::string to_string() const;
    // "0.79.2" or "<url>@<short commit>" for listings
    std::string display() const;

    bool operator==(const ResolvedVersion& o) const;
    bool operator!=(const ResolvedVersion& o) const { return !(*this == o); }
};

} // namespace penv
