#include <penv/sha256.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

namespace penv {

// FIPS 180-4 section 4.2.2
static constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

static inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

static inline void store_be(uint8_t* p, uint64_t v, int bytes) {
    for (int i = bytes - 1; i >= 0; --i) {
        p[i] = uint8_t(v);
        v >>= 8;
    }
}

Sha256::Sha256()
    : state_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
             0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void Sha256::compress(const uint8_t block[64]) {
    uint32_t w[64];
    for (int t = 0; t < 16; ++t) {
        w[t] = load_be32(block + t * 4);
    }
    for (int t = 16; t < 64; ++t) {
        uint32_t s0 = rotr(w[t-15], 7) ^ rotr(w[t-15], 18) ^ (w[t-15] >> 3);
        uint32_t s1 = rotr(w[t-2], 17) ^ rotr(w[t-2], 19) ^ (w[t-2] >> 10);
        w[t] = w[t-16] + s0 + w[t-7] + s1;
    }

    // v = a, b, c, d, e, f, g, h
    std::array<uint32_t, 8> v = state_;
    for (int t = 0; t < 64; ++t) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t sum1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t choose = (e & v[5]) ^ (~e & v[6]);
        uint32_t t1 = v[7] + sum1 + choose + K[t] + w[t];
        uint32_t sum0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t majority = (a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = sum0 + majority;

        std::copy_backward(v.begin(), v.end() - 1, v.end());
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (size_t i = 0; i < 8; ++i) {
        state_[i] += v[i];
    }
}

void Sha256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        size_t take = std::min(len, sizeof(block_) - block_len_);
        std::memcpy(block_ + block_len_, data, take);
        block_len_ += take;
        data += take;
        len -= take;
        if (block_len_ == sizeof(block_)) {
            compress(block_);
            block_len_ = 0;
        }
    }
}

void Sha256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::array<uint8_t, 32> Sha256::finalize() {
    uint64_t bit_length = length_ * 8;

    block_[block_len_++] = 0x80;
    if (block_len_ > 56) {
        std::memset(block_ + block_len_, 0, 64 - block_len_);
        compress(block_);
        block_len_ = 0;
    }
    std::memset(block_ + block_len_, 0, 56 - block_len_);
    store_be(block_ + 56, bit_length, 8);
    compress(block_);
    block_len_ = 0;

    std::array<uint8_t, 32> digest;
    for (size_t i = 0; i < 8; ++i) {
        store_be(digest.data() + i * 4, state_[i], 4);
    }
    return digest;
}

std::string Sha256::to_hex(const std::array<uint8_t, 32>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::string Sha256::hash_hex(const std::string& input) {
    Sha256 ctx;
    ctx.update(input);
    return to_hex(ctx.finalize());
}

Result<std::string> Sha256::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PenvError{PenvError::IO,
            "cannot open '" + path.string() + "' for hashing"};
    }

    Sha256 ctx;
    char buf[16384];
    while (in) {
        in.read(buf, sizeof(buf));
        if (in.gcount() > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buf),
                       static_cast<size_t>(in.gcount()));
        }
    }
    if (in.bad()) {
        return PenvError{PenvError::IO,
            "read error while hashing '" + path.string() + "'"};
    }
    return Result<std::string>::ok(to_hex(ctx.finalize()));
}

bool is_hex_digest(const std::string& s) {
    return s.size() == 64 &&
        std::all_of(s.begin(), s.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
}

Result<std::string> parse_checksum_file(const std::string& content) {
    auto start = content.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return PenvError{PenvError::Parse, "checksum file is empty"};
    }
    auto end = content.find_first_of(" \t\r\n", start);
    std::string digest = content.substr(start,
        end == std::string::npos ? std::string::npos : end - start);

    if (!is_hex_digest(digest)) {
        return PenvError{PenvError::Parse,
            "checksum file does not start with a sha256 digest",
            "expected 64 hex characters, got '" + digest.substr(0, 80) + "'"};
    }
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return Result<std::string>::ok(std::move(digest));
}

} // namespace penv
