#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Owned, variable-length byte buffer.  Data blocks, generic digests and
/// proof entries are all carried as Bytes.
using Bytes = std::vector<uint8_t>;

/// Borrowed view over a byte buffer.
using ByteSpan = std::span<const uint8_t>;

/// View the characters of a string as raw bytes (no copy).
[[nodiscard]] inline ByteSpan as_bytes(std::string_view sv) noexcept {
    return {reinterpret_cast<const uint8_t*>(sv.data()), sv.size()};
}

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array in digest order
// ---------------------------------------------------------------------------
// Bytes are kept exactly as a hash function emits them: index 0 is the first
// output byte.  Hex rendering and ordering both walk the array from index 0,
// so to_hex() matches the usual published test-vector notation and
// comparison is plain lexicographic byte order.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    // -- Construction -------------------------------------------------------

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    /// Construct from exactly N raw bytes.
    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse exactly 2*N hex chars.  Accepts an optional "0x" / "0X"
    /// prefix.  Throws std::invalid_argument on malformed input.
    static Blob from_hex(std::string_view hex);

    // -- Serialization ------------------------------------------------------

    /// Return 2*N lower-case hex chars, no prefix.
    [[nodiscard]] std::string to_hex() const;

    /// Copy into a variable-length buffer.
    [[nodiscard]] Bytes to_bytes() const {
        return Bytes(bytes_.begin(), bytes_.end());
    }

    // -- Raw access ---------------------------------------------------------

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] ByteSpan span() const noexcept {
        return {bytes_.data(), N};
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    // -- Queries ------------------------------------------------------------

    [[nodiscard]] bool is_zero() const noexcept;

    // -- Comparison (lexicographic by byte) -----------------------------------

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 32-byte digest value (SHA-256 output)
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    // Re-expose static factories returning uint256 (not Blob<32>).
    static uint256 from_hex(std::string_view hex);
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
};

}  // namespace core

// ---------------------------------------------------------------------------
// std::hash specialization
// ---------------------------------------------------------------------------
template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};
