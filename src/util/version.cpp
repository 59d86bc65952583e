#include <penv/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace penv {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool parse_number(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string strip_v(const std::string& s) {
    if (s.size() > 1 && (s[0] == 'v' || s[0] == 'V') &&
        std::isdigit(static_cast<unsigned char>(s[1]))) {
        return s.substr(1);
    }
    return s;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, sep)) parts.push_back(part);
    if (!s.empty() && s.back() == sep) parts.emplace_back();
    return parts;
}

// Dot-separated identifiers of [0-9A-Za-z-], none empty
static bool valid_identifiers(const std::string& s) {
    if (s.empty()) return false;
    for (const auto& ident : split(s, '.')) {
        if (ident.empty()) return false;
        for (char c : ident) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
    }
    return true;
}

static bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

// Semver rule 11: numeric identifiers compare numerically and sort before
// alphanumeric ones; a shorter list of equal prefix sorts first.
static int compare_prerelease(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    auto ai = split(a, '.');
    auto bi = split(b, '.');
    size_t n = std::min(ai.size(), bi.size());
    for (size_t i = 0; i < n; ++i) {
        bool an = is_numeric(ai[i]);
        bool bn = is_numeric(bi[i]);
        if (an && bn) {
            // Compare by length first so large numbers don't overflow
            std::string x = ai[i].substr(std::min(ai[i].find_first_not_of('0'), ai[i].size() - 1));
            std::string y = bi[i].substr(std::min(bi[i].find_first_not_of('0'), bi[i].size() - 1));
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            int c = x.compare(y);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (an != bn) {
            return an ? -1 : 1;
        } else {
            int c = ai[i].compare(bi[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    if (ai.size() == bi.size()) return 0;
    return ai.size() < bi.size() ? -1 : 1;
}

static Version make_version(int major, int minor, int patch) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    return v;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = strip_v(trim(input));
    if (s.empty()) {
        return PenvError{PenvError::Version, "empty version string"};
    }

    Version v;
    auto plus = s.find('+');
    if (plus != std::string::npos) {
        v.build = s.substr(plus + 1);
        if (!valid_identifiers(v.build)) {
            return PenvError{PenvError::Version,
                "invalid build metadata in '" + input + "'"};
        }
        s = s.substr(0, plus);
    }

    auto dash = s.find('-');
    if (dash != std::string::npos) {
        v.prerelease = s.substr(dash + 1);
        if (!valid_identifiers(v.prerelease)) {
            return PenvError{PenvError::Version,
                "invalid prerelease tag in '" + input + "'"};
        }
        s = s.substr(0, dash);
    }

    auto parts = split(s, '.');
    if (parts.size() != 3 ||
        !parse_number(parts[0], v.major) ||
        !parse_number(parts[1], v.minor) ||
        !parse_number(parts[2], v.patch)) {
        return PenvError{PenvError::Version,
            "invalid version '" + input + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) s += "-" + prerelease;
    if (!build.empty()) s += "+" + build;
    return s;
}

bool Version::same_triple(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch;
}

int Version::compare(const Version& o) const {
    if (major != o.major) return major < o.major ? -1 : 1;
    if (minor != o.minor) return minor < o.minor ? -1 : 1;
    if (patch != o.patch) return patch < o.patch ? -1 : 1;
    return compare_prerelease(prerelease, o.prerelease);
}

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& input) {
    std::string s = strip_v(trim(input));
    if (s.empty()) {
        return PenvError{PenvError::Version, "empty version in requirement"};
    }

    PartialVersion pv;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        pv.prerelease = s.substr(dash + 1);
        if (!valid_identifiers(pv.prerelease)) {
            return PenvError{PenvError::Version,
                "invalid prerelease tag in '" + input + "'"};
        }
        s = s.substr(0, dash);
    }

    auto parts = split(s, '.');
    bool ok = !parts.empty() && parts.size() <= 3 && parse_number(parts[0], pv.major);
    if (ok && parts.size() >= 2) ok = parse_number(parts[1], pv.minor);
    if (ok && parts.size() == 3) ok = parse_number(parts[2], pv.patch);
    if (!ok) {
        return PenvError{PenvError::Version,
            "invalid version '" + input + "' in requirement"};
    }
    if (!pv.prerelease.empty() && pv.patch < 0) {
        return PenvError{PenvError::Version,
            "prerelease tag requires a full major.minor.patch in '" + input + "'"};
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (patch >= 0) s += "." + std::to_string(patch);
    }
    if (!prerelease.empty()) s += "-" + prerelease;
    return s;
}

Version PartialVersion::floor() const {
    Version v = make_version(major, std::max(minor, 0), std::max(patch, 0));
    v.prerelease = prerelease;
    return v;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

// Smallest version above everything the partial version names,
// e.g. 1.2 -> 1.3.0 and 1 -> 2.0.0
static Version next_after_partial(const PartialVersion& pv) {
    if (pv.minor < 0) return make_version(pv.major + 1, 0, 0);
    if (pv.patch < 0) return make_version(pv.major, pv.minor + 1, 0);
    return make_version(pv.major, pv.minor, pv.patch + 1);
}

bool VersionConstraint::contains(const Version& v) const {
    const Version lower = version.floor();

    switch (op) {
    case ConstraintOp::Any:
        return true;

    case ConstraintOp::Exact:
        if (version.patch >= 0) return v == lower;
        return v >= lower && v < next_after_partial(version);

    case ConstraintOp::Caret: {
        if (v < lower) return false;
        Version upper;
        if (version.major > 0 || version.minor < 0) {
            upper = make_version(version.major + 1, 0, 0);
        } else if (version.minor > 0 || version.patch < 0) {
            upper = make_version(0, version.minor + 1, 0);
        } else {
            upper = make_version(0, 0, version.patch + 1);
        }
        return v < upper;
    }

    case ConstraintOp::Tilde: {
        if (v < lower) return false;
        Version upper = version.minor < 0
            ? make_version(version.major + 1, 0, 0)
            : make_version(version.major, version.minor + 1, 0);
        return v < upper;
    }

    case ConstraintOp::GreaterEq:
        return v >= lower;

    case ConstraintOp::Greater:
        if (version.patch >= 0) return v > lower;
        return v >= next_after_partial(version);

    case ConstraintOp::LessEq:
        if (version.patch >= 0) return v <= lower;
        return v < next_after_partial(version);

    case ConstraintOp::Less:
        return v < lower;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    switch (op) {
    case ConstraintOp::Any:       return "*";
    case ConstraintOp::Exact:     return "=" + version.to_string();
    case ConstraintOp::Caret:     return "^" + version.to_string();
    case ConstraintOp::Tilde:     return "~" + version.to_string();
    case ConstraintOp::GreaterEq: return ">=" + version.to_string();
    case ConstraintOp::Greater:   return ">" + version.to_string();
    case ConstraintOp::LessEq:    return "<=" + version.to_string();
    case ConstraintOp::Less:      return "<" + version.to_string();
    }
    return "";
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static bool is_wildcard(const std::string& s) {
    return s == "*" || s == "x" || s == "X";
}

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return PenvError{PenvError::Version, "empty comparator in requirement"};
    }

    VersionConstraint vc;
    if (is_wildcard(s)) {
        vc.op = ConstraintOp::Any;
        return Result<VersionConstraint>::ok(vc);
    }

    bool explicit_op = true;
    size_t pos = 0;
    if (s.compare(0, 2, ">=") == 0)      { vc.op = ConstraintOp::GreaterEq; pos = 2; }
    else if (s.compare(0, 2, "<=") == 0) { vc.op = ConstraintOp::LessEq; pos = 2; }
    else if (s[0] == '>')                { vc.op = ConstraintOp::Greater; pos = 1; }
    else if (s[0] == '<')                { vc.op = ConstraintOp::Less; pos = 1; }
    else if (s[0] == '=')                { vc.op = ConstraintOp::Exact; pos = 1; }
    else if (s[0] == '^')                { vc.op = ConstraintOp::Caret; pos = 1; }
    else if (s[0] == '~')                { vc.op = ConstraintOp::Tilde; pos = 1; }
    else {
        vc.op = ConstraintOp::Caret;
        explicit_op = false;
    }

    std::string ver_str = trim(s.substr(pos));
    if (ver_str.empty()) {
        return PenvError{PenvError::Version,
            "missing version in comparator '" + s + "'"};
    }

    // "0.79.*" is the same range as "=0.79"
    bool had_wildcard = false;
    while (ver_str.size() > 2 && ver_str[ver_str.size() - 2] == '.' &&
           is_wildcard(ver_str.substr(ver_str.size() - 1))) {
        ver_str.resize(ver_str.size() - 2);
        had_wildcard = true;
    }
    if (had_wildcard) {
        if (explicit_op && vc.op != ConstraintOp::Exact) {
            return PenvError{PenvError::Version,
                "wildcard cannot be combined with an operator in '" + s + "'"};
        }
        vc.op = ConstraintOp::Exact;
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();
    vc.version = std::move(pv).value();
    return Result<VersionConstraint>::ok(std::move(vc));
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return PenvError{PenvError::Version, "empty version requirement"};
    }

    VersionReq req;
    for (const auto& token : split(s, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) {
            return c.error().context("in requirement '" + s + "'");
        }
        req.constraints.push_back(std::move(c).value());
    }
    return Result<VersionReq>::ok(std::move(req));
}

VersionReq VersionReq::any() {
    VersionReq req;
    req.constraints.push_back(VersionConstraint{});
    return req;
}

bool VersionReq::matches(const Version& v) const {
    bool in_range = std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.contains(v); });
    if (!in_range) return false;
    if (!v.is_prerelease()) return true;

    return std::any_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) {
            return !c.version.prerelease.empty() && c.version.floor().same_triple(v);
        });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace penv
