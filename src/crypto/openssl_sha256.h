#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 through the OpenSSL 3.0+ EVP API.
//
// This is an independent implementation of the same function as
// crypto/sha256.h.  It backs OpensslSha256Hasher and serves as the
// cross-check for the from-scratch engine and as the baseline in the
// benchmark.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

/// SHA-256 of a byte span via EVP_sha256().  Throws std::runtime_error if
/// OpenSSL reports a failure.
[[nodiscard]] core::uint256 openssl_sha256(std::span<const uint8_t> data);

}  // namespace crypto
