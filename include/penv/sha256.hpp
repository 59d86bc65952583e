#pragma once

#include <penv/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace penv {

// Streaming SHA-256 (FIPS 180-4). Used for artifact verification and for
// the content address of git checkouts.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Object must not be reused after this call.
    std::array<uint8_t, 32> finalize();

    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string to_hex(const std::array<uint8_t, 32>& bytes);

private:
    void compress(const uint8_t block[64]);

    std::array<uint32_t, 8> state_;
    uint64_t length_ = 0;
    uint8_t block_[64];
    size_t block_len_ = 0;
};

// True for exactly 64 lowercase or uppercase hex characters
bool is_hex_digest(const std::string& s);

// Extract the digest from a published checksum file. Accepts both the bare
// "<digest>" form and the sha256sum "<digest>  <filename>" form.
Result<std::string> parse_checksum_file(const std::string& content);

} // namespace penv
