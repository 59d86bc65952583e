#include "test_helpers.hpp"
#include <penv/sha256.hpp>
#include <cctype>

using namespace penv;
using penv::testing::TempDir;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(Sha256::hash_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 NIST vectors", "[sha256]") {
    REQUIRE(Sha256::hash_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(Sha256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    REQUIRE(Sha256::hash_hex(
                "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmno"
                "ijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu") ==
            "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    Sha256 ctx;
    ctx.update(reinterpret_cast<const uint8_t*>("a"), 1);
    ctx.update(std::string("b"));
    ctx.update(reinterpret_cast<const uint8_t*>("c"), 1);
    REQUIRE(Sha256::to_hex(ctx.finalize()) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 large input", "[sha256]") {
    REQUIRE(Sha256::hash_hex(std::string(10000, 'a')) ==
            "27dd1f61b867b6a0f6e9d8a41c43231de52107e53ae424de8f847b821db4b711");
}

TEST_CASE("SHA256 hash_file matches hash_hex", "[sha256]") {
    TempDir td;
    std::string content(70000, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i * 31);
    auto file = td.write_file("blob.bin", content);

    auto r = Sha256::hash_file(file);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Sha256::hash_hex(content));
}

TEST_CASE("SHA256 hash_file on a missing file is an IO error", "[sha256]") {
    auto r = Sha256::hash_file("/nonexistent/penv/blob");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::IO);
}

TEST_CASE("is_hex_digest", "[sha256]") {
    REQUIRE(is_hex_digest(std::string(64, 'a')));
    REQUIRE(is_hex_digest(std::string(64, 'F')));
    REQUIRE_FALSE(is_hex_digest(std::string(63, 'a')));
    REQUIRE_FALSE(is_hex_digest(std::string(64, 'g')));
}

TEST_CASE("parse_checksum_file accepts bare and sha256sum forms", "[sha256]") {
    const std::string digest = Sha256::hash_hex("pcli");

    auto bare = parse_checksum_file(digest + "\n");
    REQUIRE(bare.is_ok());
    REQUIRE(bare.value() == digest);

    std::string upper = digest;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto sum = parse_checksum_file(upper + "  pcli-x86_64-unknown-linux-gnu.tar.gz\n");
    REQUIRE(sum.is_ok());
    REQUIRE(sum.value() == digest);
}

TEST_CASE("parse_checksum_file rejects garbage", "[sha256]") {
    REQUIRE(parse_checksum_file("").is_err());
    REQUIRE(parse_checksum_file("<html>Not Found</html>").is_err());
    auto r = parse_checksum_file("abc123  file.tar.gz");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PenvError::Parse);
}
