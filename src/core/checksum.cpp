/**
 * @file checksum.cpp
 * @brief SHA-256 implementation for harvested file digests
 */

#include <kcenon/log_harvest/core/checksum.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace kcenon::log_harvest {

namespace {

constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

constexpr std::array<uint32_t, 8> SHA256_H0 = {0x6a09e667, 0xbb67ae85, 0x3c6ef372,
                                               0xa54ff53a, 0x510e527f, 0x9b05688c,
                                               0x1f83d9ab, 0x5be0cd19};

constexpr auto rotr(uint32_t x, int n) -> uint32_t {
    return (x >> n) | (x << (32 - n));
}

void sha256_transform(std::array<uint32_t, 8>& state, const uint8_t* block) {
    std::array<uint32_t, 64> w{};

    for (int i = 0; i < 16; ++i) {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<uint32_t>(block[i * 4 + 3]);
    }

    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    auto v = state;
    for (int i = 0; i < 64; ++i) {
        uint32_t S1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t temp1 = v[7] + S1 + ch + SHA256_K[i] + w[i];
        uint32_t S0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);

        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + temp1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = temp1 + S0 + maj;
    }

    for (std::size_t i = 0; i < 8; ++i) {
        state[i] += v[i];
    }
}

/**
 * @brief Incremental SHA-256 state so files can be hashed in large reads
 */
class sha256_context {
public:
    void update(const uint8_t* data, std::size_t length) {
        total_bytes_ += length;
        for (std::size_t i = 0; i < length; ++i) {
            block_[block_pos_++] = data[i];
            if (block_pos_ == 64) {
                sha256_transform(state_, block_.data());
                block_pos_ = 0;
            }
        }
    }

    auto finish() -> std::string {
        uint64_t bit_length = total_bytes_ * 8;
        block_[block_pos_++] = 0x80;

        if (block_pos_ > 56) {
            while (block_pos_ < 64) {
                block_[block_pos_++] = 0;
            }
            sha256_transform(state_, block_.data());
            block_pos_ = 0;
        }

        while (block_pos_ < 56) {
            block_[block_pos_++] = 0;
        }

        for (int i = 7; i >= 0; --i) {
            block_[block_pos_++] = static_cast<uint8_t>(bit_length >> (i * 8));
        }
        sha256_transform(state_, block_.data());

        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (uint32_t word : state_) {
            oss << std::setw(8) << word;
        }
        return oss.str();
    }

private:
    std::array<uint32_t, 8> state_ = SHA256_H0;
    std::array<uint8_t, 64> block_{};
    std::size_t block_pos_ = 0;
    uint64_t total_bytes_ = 0;
};

constexpr std::size_t hash_read_size = 1024 * 1024;

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_open_error, "cannot open file: " + path.string()});
    }

    sha256_context ctx;
    std::vector<char> buffer(hash_read_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buffer.data()),
                       static_cast<std::size_t>(bytes_read));
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return ctx.finish();
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    sha256_context ctx;
    ctx.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return ctx.finish();
}

auto checksum::verify_sha256(const std::filesystem::path& path, const std::string& expected)
    -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    return result.value() == expected;
}

}  // namespace kcenon::log_harvest
