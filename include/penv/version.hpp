#pragma once

#include <penv/result.hpp>
#include <string>
#include <vector>

namespace penv {

// Semantic version: major.minor.patch[-prerelease][+build]
// A leading 'v' is accepted and dropped, so release tags parse directly.
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  // dot-separated identifiers, empty for a release
    std::string build;       // ignored for ordering and equality

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }
    bool same_triple(const Version& o) const;

    // Semver precedence
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

// Version as written in a comparator: "1", "1.2", "1.2.3", "1.2.3-rc.1"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int patch = -1;  // -1 means unset
    std::string prerelease;  // only with a full triple

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    // Unset components filled with zero
    Version floor() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    Caret,       // ^1.2.3, also a bare "1.2.3"
    Tilde,       // ~1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
    Any,         // *
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Any;
    PartialVersion version;

    // Pure range test. Prerelease gating is applied by VersionReq.
    bool contains(const Version& v) const;
    std::string to_string() const;
};

// Comma-separated conjunction: ">=0.79, <0.81"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    static VersionReq any();

    // A prerelease only matches when some comparator names a prerelease
    // of the same major.minor.patch.
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace penv
