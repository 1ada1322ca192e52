// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Returns the 4-bit value of a hex character, or -1 on invalid input.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// ===========================================================================
// Blob<N> -- template method definitions
// ===========================================================================

// Definitions live here and are explicitly instantiated at the bottom for
// the sizes the project uses.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    constexpr std::size_t EXPECTED_HEX_LEN = N * 2;
    if (hex.size() != EXPECTED_HEX_LEN) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(EXPECTED_HEX_LEN) +
            " hex chars, got " + std::to_string(hex.size()));
    }

    Blob<N> result;
    for (std::size_t i = 0; i < N; ++i) {
        int hi = hex_digit_value(hex[2 * i]);
        int lo = hex_digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument(
                "Blob::from_hex: invalid hex character");
        }
        result.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(N * 2);
    for (uint8_t byte : bytes_) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    int c = std::memcmp(bytes_.data(), other.bytes_.data(), N);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<32>;

// ===========================================================================
// uint256
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    Blob<32> blob = Blob<32>::from_hex(hex);
    std::memcpy(result.data(), blob.data(), 32);
    return result;
}

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    // Digest bytes are already uniformly distributed; fold the first
    // machine word.
    std::size_t h = 0;
    std::memcpy(&h, v.data(), sizeof(h));
    return h;
}
