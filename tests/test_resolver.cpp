#include <catch2/catch.hpp>
#include <penv/resolver.hpp>

#include <algorithm>
#include <random>

using namespace penv;

static std::vector<Version> versions(std::initializer_list<const char*> list) {
    std::vector<Version> out;
    for (const char* s : list) out.push_back(Version::parse(s).value());
    return out;
}

static Requirement req(const std::string& s) {
    auto r = Requirement::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("caret range picks the newest patch", "[resolver]") {
    auto index = versions({"0.79.0", "0.79.1", "0.79.2", "0.80.0"});
    auto r = resolve(req("^0.79"), index);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "0.79.2");
}

TEST_CASE("candidate order does not matter", "[resolver]") {
    auto index = versions({"0.79.0", "0.79.1", "0.79.2", "0.80.0", "0.78.5", "0.79.10"});
    std::mt19937 rng(7);
    for (int i = 0; i < 10; ++i) {
        std::shuffle(index.begin(), index.end(), rng);
        REQUIRE(resolve(req("^0.79"), index).value().to_string() == "0.79.10");
    }
}

TEST_CASE("result is an upper bound among satisfying candidates", "[resolver]") {
    auto index = versions({"0.1.0", "0.2.0", "0.2.5", "1.0.0", "1.2.0", "1.3.0-rc.1", "2.0.0"});
    for (const char* r : {"^0.2", "~1", ">=0.2, <1.2", "*", "latest", "=0.1", ">1.2.0-rc.1"}) {
        INFO(r);
        auto requirement = req(r);
        auto resolved = resolve(requirement, index);
        auto matching = matching_versions(requirement, index);
        if (matching.empty()) {
            REQUIRE(resolved.is_err());
            continue;
        }
        REQUIRE(resolved.is_ok());
        for (const auto& v : matching) REQUIRE(v <= resolved.value().version);
        REQUIRE(requirement.accepts(resolved.value().version));
    }
}

TEST_CASE("latest skips prereleases", "[resolver]") {
    auto index = versions({"0.79.2", "0.80.0-rc.1"});
    REQUIRE(resolve(req("latest"), index).value().to_string() == "0.79.2");
}

TEST_CASE("explicit prerelease can be resolved", "[resolver]") {
    auto index = versions({"0.79.2", "0.80.0-rc.1", "0.80.0-rc.2"});
    REQUIRE(resolve(req(">=0.80.0-rc.1"), index).value().to_string() == "0.80.0-rc.2");
}

TEST_CASE("empty candidate set is NoReleases", "[resolver]") {
    auto r = resolve(req("^0.79"), {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NoReleases);
}

TEST_CASE("no satisfying candidate is NotFound", "[resolver]") {
    auto r = resolve(req("^0.81"), versions({"0.79.0", "0.80.0"}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NotFound);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("source requirement resolves to itself", "[resolver]") {
    auto r = resolve(req("https://github.com/penumbra-zone/penumbra"), {});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_source());
    REQUIRE(r.value().url == "https://github.com/penumbra-zone/penumbra");
    REQUIRE(r.value().commit.empty());
}

TEST_CASE("matching_versions is sorted highest first", "[resolver]") {
    auto out = matching_versions(req("^0.79"), versions({"0.79.0", "0.79.2", "0.80.0", "0.79.1"}));
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].to_string() == "0.79.2");
    REQUIRE(out[2].to_string() == "0.79.0");
}
