#include <catch2/catch.hpp>
#include <penv/version.hpp>

using namespace penv;

static Version V(const std::string& s) {
    auto r = Version::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static bool req_matches(const std::string& req, const std::string& ver) {
    auto r = VersionReq::parse(req);
    REQUIRE(r.is_ok());
    return r.value().matches(V(ver));
}

// ===== Version parsing =====

TEST_CASE("parse simple version", "[version]") {
    auto v = V("0.79.2");
    REQUIRE(v.major == 0);
    REQUIRE(v.minor == 79);
    REQUIRE(v.patch == 2);
    REQUIRE_FALSE(v.is_prerelease());
    REQUIRE(v.to_string() == "0.79.2");
}

TEST_CASE("parse strips a leading v", "[version]") {
    REQUIRE(V("v0.80.0") == V("0.80.0"));
    REQUIRE(V("v0.80.0").to_string() == "0.80.0");
}

TEST_CASE("parse prerelease and build", "[version]") {
    auto v = V("1.0.0-rc.1+linux.x86");
    REQUIRE(v.prerelease == "rc.1");
    REQUIRE(v.build == "linux.x86");
    REQUIRE(v.is_prerelease());
    REQUIRE(v.to_string() == "1.0.0-rc.1+linux.x86");
}

TEST_CASE("version parse errors", "[version]") {
    for (const char* bad : {"", "1", "1.2", "abc", "1.2.3-", "1.2.3+", "1.2.3.4",
                            "1..3", "-1.2.3", "1.2.3-rc..1", "vv1.2.3"}) {
        auto r = Version::parse(bad);
        INFO(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PenvError::Version);
    }
}

// ===== Ordering =====

TEST_CASE("numeric ordering of components", "[version]") {
    REQUIRE(V("0.79.2") < V("0.80.0"));
    REQUIRE(V("0.9.0") < V("0.10.0"));
    REQUIRE(V("1.0.0") > V("0.99.99"));
    REQUIRE(V("0.79.10") > V("0.79.9"));
}

TEST_CASE("prerelease sorts below its release", "[version]") {
    REQUIRE(V("1.0.0-rc.1") < V("1.0.0"));
    REQUIRE(V("1.0.0-rc.1") > V("0.99.0"));
}

TEST_CASE("semver prerelease precedence chain", "[version]") {
    const char* chain[] = {"1.0.0-alpha", "1.0.0-alpha.1", "1.0.0-alpha.beta",
                           "1.0.0-beta", "1.0.0-beta.2", "1.0.0-beta.11",
                           "1.0.0-rc.1", "1.0.0"};
    for (size_t i = 0; i + 1 < sizeof(chain) / sizeof(chain[0]); ++i) {
        INFO(chain[i] << " < " << chain[i + 1]);
        REQUIRE(V(chain[i]) < V(chain[i + 1]));
    }
}

TEST_CASE("build metadata is ignored for equality", "[version]") {
    REQUIRE(V("1.2.3+a") == V("1.2.3+b"));
    REQUIRE(V("1.2.3+a").compare(V("1.2.3")) == 0);
}

// ===== Requirements =====

TEST_CASE("caret requirement", "[version]") {
    REQUIRE(req_matches("^0.79", "0.79.0"));
    REQUIRE(req_matches("^0.79", "0.79.2"));
    REQUIRE_FALSE(req_matches("^0.79", "0.80.0"));
    REQUIRE_FALSE(req_matches("^0.79", "0.78.9"));

    REQUIRE(req_matches("^1.2", "1.9.0"));
    REQUIRE_FALSE(req_matches("^1.2", "2.0.0"));
    REQUIRE(req_matches("^0.0.3", "0.0.3"));
    REQUIRE_FALSE(req_matches("^0.0.3", "0.0.4"));
}

TEST_CASE("bare version is a caret requirement", "[version]") {
    REQUIRE(req_matches("0.79", "0.79.5"));
    REQUIRE_FALSE(req_matches("0.79", "0.80.0"));
    REQUIRE(req_matches("0.79.1", "0.79.3"));
    REQUIRE_FALSE(req_matches("0.79.1", "0.79.0"));
}

TEST_CASE("tilde requirement", "[version]") {
    REQUIRE(req_matches("~0.79.1", "0.79.4"));
    REQUIRE_FALSE(req_matches("~0.79.1", "0.80.0"));
    REQUIRE(req_matches("~1", "1.5.0"));
    REQUIRE_FALSE(req_matches("~1", "2.0.0"));
}

TEST_CASE("exact and wildcard requirements", "[version]") {
    REQUIRE(req_matches("=0.79.2", "0.79.2"));
    REQUIRE_FALSE(req_matches("=0.79.2", "0.79.3"));
    REQUIRE(req_matches("=0.79", "0.79.7"));
    REQUIRE(req_matches("0.79.*", "0.79.7"));
    REQUIRE_FALSE(req_matches("0.79.*", "0.80.0"));
    REQUIRE(req_matches("*", "3.1.4"));
}

TEST_CASE("comparison operators and conjunctions", "[version]") {
    REQUIRE(req_matches(">=0.79", "0.80.0"));
    REQUIRE(req_matches(">0.79", "0.80.0"));
    REQUIRE_FALSE(req_matches(">0.79", "0.79.9"));
    REQUIRE(req_matches("<=0.79", "0.79.9"));
    REQUIRE_FALSE(req_matches("<0.79.0", "0.79.0"));
    REQUIRE(req_matches(">=0.79.1, <0.80", "0.79.4"));
    REQUIRE_FALSE(req_matches(">=0.79.1, <0.80", "0.80.0"));
    REQUIRE_FALSE(req_matches(">=0.79.1, <0.80", "0.79.0"));
}

TEST_CASE("prereleases only match when requested", "[version]") {
    REQUIRE_FALSE(req_matches("^0.80", "0.80.1-rc.1"));
    REQUIRE_FALSE(req_matches("<0.80.0", "0.80.0-rc.1"));
    REQUIRE_FALSE(req_matches("*", "1.0.0-beta"));

    REQUIRE(req_matches(">=0.80.0-rc.1", "0.80.0-rc.2"));
    REQUIRE(req_matches(">=0.80.0-rc.1", "0.80.1"));
    // A prerelease of a different triple stays excluded
    REQUIRE_FALSE(req_matches(">=0.80.0-rc.1", "0.81.0-rc.1"));
}

TEST_CASE("requirement parse errors", "[version]") {
    for (const char* bad : {"", " ", "^", ">=", "0.79,", "abc", "^0.79.*", "1.2-rc.1"}) {
        INFO(bad);
        REQUIRE(VersionReq::parse(bad).is_err());
    }
}

TEST_CASE("requirement to_string normalizes", "[version]") {
    REQUIRE(VersionReq::parse("0.79").value().to_string() == "^0.79");
    REQUIRE(VersionReq::parse(">=0.79.1,<0.80").value().to_string() == ">=0.79.1, <0.80");
    REQUIRE(VersionReq::parse("0.79.*").value().to_string() == "=0.79");
    REQUIRE(VersionReq::any().to_string() == "*");
}
