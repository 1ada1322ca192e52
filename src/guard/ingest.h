#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Block ingestion: turns a file or directory into the ordered list of
// blocks that become Merkle leaves.
//
//   file, block_size == 0   one block holding the whole file
//   file, block_size  > 0   consecutive block_size chunks, last may be short
//   directory               one block per regular file, ordered by relative
//                           generic path (recursive descends into subdirs)
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/types.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace guard {

struct IngestOptions {
    std::filesystem::path path;
    std::size_t block_size = 0;
    bool recursive = false;
};

/// Reads the blocks described by @p opts.
/// Errors: IO_NOT_FOUND if the path does not exist, IO_READ if a file or
/// directory cannot be read, IO_ERROR for other file types.
[[nodiscard]] core::Result<std::vector<core::Bytes>> collect_blocks(
    const IngestOptions& opts);

/// Display labels for the blocks collect_blocks() would return, in the
/// same order: the relative path for directory entries, the file name for
/// a whole file, and "name#N" for the N-th chunk.
[[nodiscard]] core::Result<std::vector<std::string>> collect_block_names(
    const IngestOptions& opts);

}  // namespace guard
