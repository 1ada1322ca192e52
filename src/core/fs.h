#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace core::fs {

/// Convenience alias so callers don't need to spell out std::filesystem::path.
using path = std::filesystem::path;

/// Returns true if `p` refers to an existing regular file.
bool file_exists(const path& p);

/// Returns true if `p` refers to an existing directory.
bool dir_exists(const path& p);

/// Returns the size of the file in bytes, or std::nullopt on error.
std::optional<uint64_t> file_size(const path& p);

/// Reads the entire contents of `p` as raw bytes.
/// Returns std::nullopt if the file cannot be opened or read.
std::optional<Bytes> read_file(const path& p);

/// Lists the regular files below `dir` as paths relative to `dir`, sorted
/// by their generic ('/'-separated) string, byte by byte.  With `recursive`
/// the listing descends into subdirectories; symlinked directories are not
/// followed.  Returns std::nullopt if `dir` cannot be iterated.
std::optional<std::vector<path>> list_files(const path& dir, bool recursive);

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// Writes `content` to `p` by writing a sibling temporary file and renaming
/// it over the target.  Returns true on success.
bool write_file(const path& p, ByteSpan content);

} // namespace core::fs
