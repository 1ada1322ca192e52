#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 (FIPS 180-4), implemented from scratch.
//
// Two compression back-ends share the same padding and output encoding:
//   - the portable reference rounds, always available;
//   - the x86 SHA extensions (SHA-NI), used when the CPU reports them.
// Both produce byte-identical digests.  sha256() picks the fastest one.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace crypto {

inline constexpr std::size_t SHA256_DIGEST_SIZE = 32;
inline constexpr std::size_t SHA256_BLOCK_SIZE  = 64;

// ===================================================================
// One-shot hash functions
// ===================================================================

/// SHA-256 of a byte span, using the accelerated path when available.
[[nodiscard]] core::uint256 sha256(std::span<const uint8_t> data);

/// SHA-256 of an arbitrary memory region.
[[nodiscard]] core::uint256 sha256(const void* data, size_t len);

/// SHA-256 through the portable compression function only.
[[nodiscard]] core::uint256 sha256_reference(std::span<const uint8_t> data);

/// SHA-256 through the SHA-NI compression function.  Falls back to the
/// portable path on CPUs without the extensions.
[[nodiscard]] core::uint256 sha256_accelerated(std::span<const uint8_t> data);

/// True if sha256_accelerated() actually runs the SHA-NI code.
[[nodiscard]] bool sha256_accelerated_available() noexcept;

/// Applies Merkle-Damgard padding: 0x80, zeros up to 56 mod 64, then the
/// message length in bits as a 64-bit big-endian integer.  The result is
/// always a non-empty multiple of SHA256_BLOCK_SIZE.
[[nodiscard]] std::vector<uint8_t> sha256_pad(std::span<const uint8_t> message);

namespace detail {

using Sha256State = std::array<uint32_t, 8>;

/// H(0) from FIPS 180-4 section 5.3.3.
inline constexpr Sha256State SHA256_INITIAL_STATE = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

/// Round constants K[0..63] from FIPS 180-4 section 4.2.2.
extern const std::array<uint32_t, 64> SHA256_ROUND_CONSTANTS;

/// Expands one 64-byte block into the 64-word message schedule.
void sha256_message_schedule(const uint8_t* block,
                             std::array<uint32_t, 64>& w) noexcept;

/// Folds @p n_blocks consecutive 64-byte blocks into @p state.
void sha256_compress_portable(Sha256State& state, const uint8_t* blocks,
                              size_t n_blocks) noexcept;

/// CPU probe for SHA, SSSE3 and SSE4.1.  Always false off x86.
[[nodiscard]] bool sha256_shani_supported() noexcept;

/// SHA-NI variant of sha256_compress_portable.  Only call when
/// sha256_shani_supported() returned true.
void sha256_compress_shani(Sha256State& state, const uint8_t* blocks,
                           size_t n_blocks);

}  // namespace detail

}  // namespace crypto
