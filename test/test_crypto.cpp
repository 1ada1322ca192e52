// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the SHA-256 engine and the hasher layer.

#include "test_framework.h"

#include "core/hex.h"
#include "core/types.h"
#include "crypto/hasher.h"
#include "crypto/openssl_sha256.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Vector {
    std::string message;
    const char* digest;
};

const std::vector<Vector>& known_vectors() {
    static const std::vector<Vector> vectors = {
        {"",
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
        {"abc",
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
        {"a",
         "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb"},
        {"hello world",
         "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"},
        {"abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
         "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"},
        {"abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmnhijklmno"
         "ijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu",
         "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1"},
        {"The quick brown fox jumps over the lazy dog",
         "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592"},
    };
    return vectors;
}

// Deterministic filler so failures reproduce.
std::vector<uint8_t> pattern(std::size_t len, uint8_t seed) {
    std::vector<uint8_t> out(len);
    uint32_t x = 0x9e3779b9u ^ seed;
    for (auto& b : out) {
        x = x * 1664525u + 1013904223u;
        b = static_cast<uint8_t>(x >> 24);
    }
    return out;
}

}  // namespace

// ============================================================================
// SHA-256 known answers
// ============================================================================

TEST_CASE(SHA256, known_vectors_default_engine) {
    for (const auto& v : known_vectors()) {
        CHECK_EQ(crypto::sha256(core::as_bytes(v.message)).to_hex(),
                 std::string(v.digest));
    }
}

TEST_CASE(SHA256, known_vectors_reference_engine) {
    for (const auto& v : known_vectors()) {
        CHECK_EQ(crypto::sha256_reference(core::as_bytes(v.message)).to_hex(),
                 std::string(v.digest));
    }
}

TEST_CASE(SHA256, known_vectors_accelerated_engine) {
    for (const auto& v : known_vectors()) {
        CHECK_EQ(
            crypto::sha256_accelerated(core::as_bytes(v.message)).to_hex(),
            std::string(v.digest));
    }
}

TEST_CASE(SHA256, one_million_a) {
    std::vector<uint8_t> msg(1000000, 'a');
    const std::string expected =
        "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0";
    CHECK_EQ(crypto::sha256_reference(msg).to_hex(), expected);
    CHECK_EQ(crypto::sha256(msg).to_hex(), expected);
}

TEST_CASE(SHA256, pointer_overload_matches_span) {
    const char text[] = "hello world";
    CHECK(crypto::sha256(text, sizeof(text) - 1) ==
          crypto::sha256(core::as_bytes("hello world")));
    CHECK(crypto::sha256(nullptr, 0) ==
          crypto::sha256(std::vector<uint8_t>{}));
}

TEST_CASE(SHA256, digest_is_always_32_bytes) {
    for (std::size_t len : {0u, 1u, 55u, 56u, 64u, 1000u}) {
        auto d = crypto::sha256(pattern(len, 1));
        CHECK_EQ(d.size(), crypto::SHA256_DIGEST_SIZE);
        CHECK_EQ(d.to_bytes().size(), 32u);
    }
}

// ============================================================================
// Engine equivalence
// ============================================================================

TEST_CASE(SHA256, engines_agree_on_every_length_up_to_300) {
    int mismatches = 0;
    for (std::size_t len = 0; len <= 300; ++len) {
        auto data = pattern(len, static_cast<uint8_t>(len));
        if (crypto::sha256_reference(data) !=
            crypto::sha256_accelerated(data)) {
            ++mismatches;
        }
    }
    CHECK_EQ(mismatches, 0);
}

TEST_CASE(SHA256, engines_agree_on_multi_block_input) {
    auto data = pattern(64 * 257 + 13, 7);
    CHECK(crypto::sha256_reference(data) == crypto::sha256_accelerated(data));
}

TEST_CASE(SHA256, shani_compress_matches_portable) {
    if (!crypto::sha256_accelerated_available()) {
        std::cout << "(no SHA-NI, skipped) " << std::flush;
        return;
    }
    auto blocks = pattern(64 * 5, 3);
    crypto::detail::Sha256State a = crypto::detail::SHA256_INITIAL_STATE;
    crypto::detail::Sha256State b = crypto::detail::SHA256_INITIAL_STATE;
    crypto::detail::sha256_compress_portable(a, blocks.data(), 5);
    crypto::detail::sha256_compress_shani(b, blocks.data(), 5);
    CHECK(a == b);
}

TEST_CASE(SHA256, portable_compress_single_block_abc) {
    auto padded = crypto::sha256_pad(core::as_bytes("abc"));
    CHECK_EQ(padded.size(), crypto::SHA256_BLOCK_SIZE);

    crypto::detail::Sha256State state = crypto::detail::SHA256_INITIAL_STATE;
    crypto::detail::sha256_compress_portable(state, padded.data(), 1);
    CHECK_EQ(state[0], 0xba7816bfu);
    CHECK_EQ(state[7], 0xf20015adu);
}

TEST_CASE(SHA256, message_schedule_first_words) {
    auto padded = crypto::sha256_pad(core::as_bytes("abc"));
    std::array<uint32_t, 64> w{};
    crypto::detail::sha256_message_schedule(padded.data(), w);
    CHECK_EQ(w[0], 0x61626380u);
    CHECK_EQ(w[15], 0x00000018u);
    CHECK_EQ(w[16], 0x61626380u);
}

// ============================================================================
// Padding
// ============================================================================

TEST_CASE(SHA256, padding_layout) {
    for (std::size_t len : {0u, 1u, 55u, 56u, 63u, 64u, 119u, 120u}) {
        auto msg = pattern(len, 9);
        auto padded = crypto::sha256_pad(msg);

        CHECK(!padded.empty());
        CHECK_EQ(padded.size() % crypto::SHA256_BLOCK_SIZE, 0u);
        CHECK(padded.size() >= len + 9);
        CHECK(padded.size() < len + 9 + crypto::SHA256_BLOCK_SIZE);
        CHECK(std::equal(msg.begin(), msg.end(), padded.begin()));
        CHECK_EQ(padded[len], 0x80);

        uint64_t bits = 0;
        for (std::size_t i = padded.size() - 8; i < padded.size(); ++i) {
            bits = (bits << 8) | padded[i];
        }
        CHECK_EQ(bits, static_cast<uint64_t>(len) * 8);
    }
}

TEST_CASE(SHA256, padding_block_counts) {
    CHECK_EQ(crypto::sha256_pad(pattern(55, 0)).size(), 64u);
    CHECK_EQ(crypto::sha256_pad(pattern(56, 0)).size(), 128u);
    CHECK_EQ(crypto::sha256_pad(pattern(64, 0)).size(), 128u);
}

// ============================================================================
// OpenSSL cross-check
// ============================================================================

TEST_CASE(OpenSSL, matches_known_vectors) {
    for (const auto& v : known_vectors()) {
        CHECK_EQ(crypto::openssl_sha256(core::as_bytes(v.message)).to_hex(),
                 std::string(v.digest));
    }
}

TEST_CASE(OpenSSL, matches_engine_on_varied_lengths) {
    for (std::size_t len : {0u, 3u, 63u, 64u, 65u, 4096u, 100003u}) {
        auto data = pattern(len, 11);
        CHECK(crypto::openssl_sha256(data) == crypto::sha256(data));
    }
}

// ============================================================================
// Hasher layer
// ============================================================================

TEST_CASE(Hasher, sha256_hasher_engines) {
    crypto::Sha256Hasher auto_hasher;
    crypto::Sha256Hasher ref_hasher(crypto::Sha256Engine::REFERENCE);
    CHECK_EQ(auto_hasher.digest_size(), 32u);
    CHECK_EQ(auto_hasher.name(), "sha256");
    CHECK(ref_hasher.engine() == crypto::Sha256Engine::REFERENCE);

    auto data = core::as_bytes("hello world");
    CHECK_EQ(core::to_hex(auto_hasher.hash(data)),
             "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    CHECK(auto_hasher.hash(data) == ref_hasher.hash(data));
}

TEST_CASE(Hasher, openssl_hasher_matches) {
    crypto::OpensslSha256Hasher h;
    CHECK_EQ(h.name(), "openssl");
    CHECK_EQ(h.digest_size(), 32u);
    auto data = pattern(777, 4);
    CHECK(h.hash(data) == crypto::Sha256Hasher().hash(data));
}

TEST_CASE(Hasher, factory_by_name) {
    auto sha = crypto::make_hasher("sha256");
    CHECK_OK(sha);
    CHECK_EQ(sha.value()->name(), "sha256");

    auto ossl = crypto::make_hasher("openssl");
    CHECK_OK(ossl);
    CHECK_EQ(ossl.value()->name(), "openssl");

    CHECK_ERR_CODE(crypto::make_hasher("md5"), core::ErrorCode::CONFIG_RANGE);
}

TEST_CASE(Hasher, parse_engine_names) {
    CHECK(crypto::parse_sha256_engine("auto") == crypto::Sha256Engine::AUTO);
    CHECK(crypto::parse_sha256_engine("reference") ==
          crypto::Sha256Engine::REFERENCE);
    CHECK(!crypto::parse_sha256_engine("gpu").has_value());
}
