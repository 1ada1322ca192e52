// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/openssl_sha256.h"

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

[[noreturn]] void throw_evp(const char* step) {
    throw std::runtime_error(std::string("openssl_sha256: ") + step +
                             " failed");
}

}  // namespace

core::uint256 openssl_sha256(std::span<const uint8_t> data) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw_evp("EVP_MD_CTX_new()");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw_evp("EVP_DigestInit_ex()");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw_evp("EVP_DigestUpdate()");
    }

    core::uint256 out;
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &digest_len) != 1) {
        throw_evp("EVP_DigestFinal_ex()");
    }
    if (digest_len != out.size()) {
        throw std::runtime_error(
            "openssl_sha256: unexpected digest length " +
            std::to_string(digest_len));
    }
    return out;
}

}  // namespace crypto
