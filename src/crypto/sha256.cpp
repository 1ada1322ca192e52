// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <cstring>

namespace crypto {

namespace detail {

const std::array<uint32_t, 64> SHA256_ROUND_CONSTANTS = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u,
    0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u,
    0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
    0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u,
    0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u,
    0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u,
    0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u,
};

namespace {

constexpr uint32_t rotr(uint32_t x, unsigned n) noexcept {
    return (x >> n) | (x << (32u - n));
}

// Section 4.1.2 of FIPS 180-4.
constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22);
}
constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25);
}
constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3);
}
constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10);
}
constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}
constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

inline uint32_t read_be32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
            static_cast<uint32_t>(p[3]);
}

inline void write_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

}  // namespace

void sha256_message_schedule(const uint8_t* block,
                             std::array<uint32_t, 64>& w) noexcept {
    for (size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + 4 * i);
    }
    // uint32_t arithmetic wraps modulo 2^32.
    for (size_t i = 16; i < 64; ++i) {
        w[i] = w[i - 16] + small_sigma0(w[i - 15]) +
               w[i - 7] + small_sigma1(w[i - 2]);
    }
}

void sha256_compress_portable(Sha256State& state, const uint8_t* blocks,
                              size_t n_blocks) noexcept {
    std::array<uint32_t, 64> w;

    for (size_t blk = 0; blk < n_blocks; ++blk) {
        sha256_message_schedule(blocks + blk * SHA256_BLOCK_SIZE, w);

        uint32_t a = state[0];
        uint32_t b = state[1];
        uint32_t c = state[2];
        uint32_t d = state[3];
        uint32_t e = state[4];
        uint32_t f = state[5];
        uint32_t g = state[6];
        uint32_t h = state[7];

        for (size_t i = 0; i < 64; ++i) {
            uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) +
                          SHA256_ROUND_CONSTANTS[i] + w[i];
            uint32_t t2 = big_sigma0(a) + maj(a, b, c);
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        state[0] += a;
        state[1] += b;
        state[2] += c;
        state[3] += d;
        state[4] += e;
        state[5] += f;
        state[6] += g;
        state[7] += h;
    }
}

}  // namespace detail

// ===================================================================
// Padding and output encoding
// ===================================================================

std::vector<uint8_t> sha256_pad(std::span<const uint8_t> message) {
    const uint64_t bit_length = static_cast<uint64_t>(message.size()) * 8u;

    // Room for the 0x80 marker and the 8-byte length, rounded up to a
    // whole block.
    size_t padded_len =
        ((message.size() + 1 + 8 + SHA256_BLOCK_SIZE - 1) / SHA256_BLOCK_SIZE) *
        SHA256_BLOCK_SIZE;

    std::vector<uint8_t> padded(padded_len, 0);
    if (!message.empty()) {
        std::memcpy(padded.data(), message.data(), message.size());
    }
    padded[message.size()] = 0x80;

    for (size_t i = 0; i < 8; ++i) {
        padded[padded_len - 1 - i] = static_cast<uint8_t>(bit_length >> (8 * i));
    }
    return padded;
}

namespace {

core::uint256 encode_state(const detail::Sha256State& state) {
    core::uint256 out;
    for (size_t i = 0; i < state.size(); ++i) {
        detail::write_be32(out.data() + 4 * i, state[i]);
    }
    return out;
}

}  // namespace

// ===================================================================
// One-shot functions
// ===================================================================

core::uint256 sha256_reference(std::span<const uint8_t> data) {
    std::vector<uint8_t> padded = sha256_pad(data);
    detail::Sha256State state = detail::SHA256_INITIAL_STATE;
    detail::sha256_compress_portable(state, padded.data(),
                                     padded.size() / SHA256_BLOCK_SIZE);
    return encode_state(state);
}

core::uint256 sha256_accelerated(std::span<const uint8_t> data) {
    if (!sha256_accelerated_available()) {
        return sha256_reference(data);
    }
    std::vector<uint8_t> padded = sha256_pad(data);
    detail::Sha256State state = detail::SHA256_INITIAL_STATE;
    detail::sha256_compress_shani(state, padded.data(),
                                  padded.size() / SHA256_BLOCK_SIZE);
    return encode_state(state);
}

bool sha256_accelerated_available() noexcept {
    static const bool supported = detail::sha256_shani_supported();
    return supported;
}

core::uint256 sha256(std::span<const uint8_t> data) {
    return sha256_accelerated(data);
}

core::uint256 sha256(const void* data, size_t len) {
    return sha256(std::span<const uint8_t>(
        static_cast<const uint8_t*>(data), len));
}

}  // namespace crypto
