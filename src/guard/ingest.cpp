// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "guard/ingest.h"

#include "core/fs.h"
#include "core/logging.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace guard {

namespace {

enum class InputKind { REGULAR_FILE, DIRECTORY };

core::Result<InputKind> classify(const std::filesystem::path& p) {
    std::error_code ec;
    auto st = std::filesystem::status(p, ec);
    if (!std::filesystem::exists(st)) {
        return core::make_error(core::ErrorCode::IO_NOT_FOUND,
                                "no such file or directory: " + p.string());
    }
    if (std::filesystem::is_regular_file(st)) return InputKind::REGULAR_FILE;
    if (std::filesystem::is_directory(st))    return InputKind::DIRECTORY;
    return core::make_error(core::ErrorCode::IO_ERROR,
                            "not a regular file or directory: " + p.string());
}

core::Result<core::Bytes> read_whole(const std::filesystem::path& p) {
    auto content = core::fs::read_file(p);
    if (!content) {
        return core::make_error(core::ErrorCode::IO_READ,
                                "cannot read " + p.string());
    }
    LOG_DEBUG(core::LogCategory::IO,
              "read " + p.string() + " (" +
              std::to_string(content->size()) + " bytes)");
    return std::move(*content);
}

core::Result<std::vector<std::filesystem::path>> list_dir(
    const IngestOptions& opts) {
    auto files = core::fs::list_files(opts.path, opts.recursive);
    if (!files) {
        return core::make_error(core::ErrorCode::IO_READ,
                                "cannot list directory " + opts.path.string());
    }
    LOG_DEBUG(core::LogCategory::IO,
              opts.path.string() + ": " + std::to_string(files->size()) +
              (opts.recursive ? " files (recursive)" : " files"));
    return std::move(*files);
}

std::vector<core::Bytes> split_chunks(const core::Bytes& content,
                                      std::size_t block_size) {
    std::vector<core::Bytes> chunks;
    chunks.reserve((content.size() + block_size - 1) / block_size);
    for (std::size_t off = 0; off < content.size(); off += block_size) {
        std::size_t len = std::min(block_size, content.size() - off);
        chunks.emplace_back(content.begin() + off,
                            content.begin() + off + len);
    }
    return chunks;
}

}  // namespace

core::Result<std::vector<core::Bytes>> collect_blocks(
    const IngestOptions& opts) {
    FSG_TRY_ASSIGN(kind, classify(opts.path));

    std::vector<core::Bytes> blocks;
    if (kind == InputKind::REGULAR_FILE) {
        FSG_TRY_ASSIGN(content, read_whole(opts.path));
        if (opts.block_size == 0) {
            blocks.push_back(std::move(content));
        } else {
            blocks = split_chunks(content, opts.block_size);
        }
    } else {
        FSG_TRY_ASSIGN(files, list_dir(opts));
        blocks.reserve(files.size());
        for (const auto& rel : files) {
            FSG_TRY_ASSIGN(content, read_whole(opts.path / rel));
            blocks.push_back(std::move(content));
        }
    }

    LOG_INFO(core::LogCategory::IO,
             "collected " + std::to_string(blocks.size()) + " blocks from " +
             opts.path.string());
    return blocks;
}

core::Result<std::vector<std::string>> collect_block_names(
    const IngestOptions& opts) {
    FSG_TRY_ASSIGN(kind, classify(opts.path));

    std::vector<std::string> names;
    if (kind == InputKind::REGULAR_FILE) {
        std::string base = opts.path.filename().generic_string();
        if (opts.block_size == 0) {
            names.push_back(std::move(base));
            return names;
        }
        auto size = core::fs::file_size(opts.path);
        if (!size) {
            return core::make_error(core::ErrorCode::IO_READ,
                                    "cannot stat " + opts.path.string());
        }
        uint64_t count = (*size + opts.block_size - 1) / opts.block_size;
        for (uint64_t i = 0; i < count; ++i) {
            names.push_back(base + "#" + std::to_string(i));
        }
    } else {
        FSG_TRY_ASSIGN(files, list_dir(opts));
        for (const auto& rel : files) {
            names.push_back(rel.generic_string());
        }
    }
    return names;
}

}  // namespace guard
