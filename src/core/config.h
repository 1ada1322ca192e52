#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF          = "conf";
inline constexpr const char* CONF_INPUT         = "input";
inline constexpr const char* CONF_TEXT          = "text";
inline constexpr const char* CONF_BLOCKSIZE     = "blocksize";
inline constexpr const char* CONF_RECURSIVE     = "recursive";
inline constexpr const char* CONF_INDEX         = "index";
inline constexpr const char* CONF_LEAF          = "leaf";
inline constexpr const char* CONF_LEAFTEXT      = "leaftext";
inline constexpr const char* CONF_PROOF         = "proof";
inline constexpr const char* CONF_ROOT          = "root";
inline constexpr const char* CONF_HASHER        = "hasher";
inline constexpr const char* CONF_ENGINE        = "engine";
inline constexpr const char* CONF_LOGLEVEL      = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES = "logcategories";
inline constexpr const char* CONF_LOGFILE       = "logfile";
inline constexpr const char* CONF_HELP          = "help";

// ---------------------------------------------------------------------------
// Config  --  layered configuration with multiple sources
//
// Priority order: command-line args  >  config file  >  programmatic defaults
// Multi-value keys (e.g. -input=a -input=b) are accumulated into a
// vector accessible via get_list().  Arguments that do not start with '-'
// are kept in order as positional arguments (the command word first).
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   word                       (positional)
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' or ';', blank lines and "[section]" headers
    /// are ignored.  Whitespace around key and value is trimmed.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    // -- setters / getters --------------------------------------------------

    /// Set a default (lowest priority; replaces previous defaults).
    void set_default(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return the value for @p key as an unsigned integer.  A missing key
    /// yields @p default_val; a malformed value is CONFIG_RANGE.
    [[nodiscard]] Result<uint64_t> get_uint(std::string_view key,
                                            uint64_t default_val = 0) const;

    /// Return the value for @p key, or CONFIG_MISSING.
    [[nodiscard]] Result<std::string> require(std::string_view key) const;

    /// Return all values associated with @p key, command line first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
        return positional_;
    }

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    // Lookup checks cli_values_, then file_values_, then defaults_.
    ValueMap cli_values_;
    ValueMap file_values_;
    ValueMap defaults_;
    std::vector<std::string> positional_;

    static void insert(ValueMap& target, std::string_view key,
                       std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
