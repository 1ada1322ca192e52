#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. An optional "0x" prefix is accepted.
// Returns nullopt if the input is invalid (odd length or non-hex characters).
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Check whether a string is a valid hexadecimal encoding (even length,
// every character in [0-9a-fA-F]).
bool is_hex(std::string_view str);

// Split a separator-delimited list of hex strings (e.g. "ab12,cd34") and
// decode each entry. Empty entries are skipped. Returns nullopt if any
// entry fails to decode.
std::optional<std::vector<std::vector<uint8_t>>> from_hex_list(
    std::string_view list, char separator = ',');

}  // namespace core
