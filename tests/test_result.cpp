#include <catch2/catch.hpp>
#include <penv/result.hpp>
#include <memory>
#include <string>

using namespace penv;

static Result<int> try_double(Result<int> input) {
    PENV_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status check_positive(int x) {
    if (x <= 0) return PenvError{PenvError::InvalidArg, "not positive"};
    return ok_status();
}

static Result<std::string> describe(int x) {
    PENV_TRY(check_positive(x));
    return Result<std::string>::ok("n=" + std::to_string(x));
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(PenvError{PenvError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::NotFound);
    REQUIRE(r.error().message == "missing item");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(PenvError{PenvError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("map and and_then", "[result]") {
    auto doubled = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(doubled.value() == 10);

    bool called = false;
    auto failed = Result<int>::err(PenvError{PenvError::Parse, "bad"})
        .and_then([&](int x) { called = true; return Result<int>::ok(x); });
    REQUIRE(failed.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("PENV_TRY propagates across result types", "[result]") {
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
    auto err = try_double(Result<int>::err(PenvError{PenvError::Parse, "syntax"}));
    REQUIRE(err.error().message == "syntax");

    REQUIRE(describe(3).value() == "n=3");
    REQUIRE(describe(-1).error().code == PenvError::InvalidArg);
}

TEST_CASE("Result with a move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto owned = std::move(r).value();
    REQUIRE(*owned == 99);
}

TEST_CASE("PenvError format() with hint and location", "[error]") {
    PenvError e{PenvError::Parse, "expected a string", "check the file", "environments.toml", 4};
    auto s = e.format();
    REQUIRE(s.find("error[Parse]: expected a string") != std::string::npos);
    REQUIRE(s.find("hint: check the file") != std::string::npos);
    REQUIRE(s.find("--> environments.toml:4") != std::string::npos);
}

TEST_CASE("PenvError format() bare", "[error]") {
    auto s = PenvError{PenvError::UnknownAlias, "no environment named 'dev'"}.format();
    REQUIRE(s == "error[UnknownAlias]: no environment named 'dev'");
}

TEST_CASE("PenvError context() prefixes the message", "[error]") {
    PenvError e{PenvError::IO, "permission denied", "try again"};
    auto wrapped = e.context("writing active.toml");
    REQUIRE(wrapped.message == "writing active.toml: permission denied");
    REQUIRE(wrapped.hint == "try again");
    REQUIRE(wrapped.code == PenvError::IO);
    REQUIRE(e.message == "permission denied");
}

TEST_CASE("PenvError code names", "[error]") {
    REQUIRE(std::string(PenvError::code_name(PenvError::Checksum)) == "ChecksumMismatch");
    REQUIRE(std::string(PenvError::code_name(PenvError::Network)) == "FetchFailed");
    REQUIRE(std::string(PenvError::code_name(PenvError::DuplicateAlias)) == "DuplicateAlias");
    REQUIRE(std::string(PenvError::code_name(PenvError::VersionNotInstalled)) == "VersionNotInstalled");
    REQUIRE(std::string(PenvError::code_name(PenvError::ActivationFailed)) == "ActivationFailed");
    REQUIRE(std::string(PenvError::code_name(PenvError::NoReleases)) == "NoReleases");
}
