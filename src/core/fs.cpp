// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/fs.h"

#include <algorithm>
#include <fstream>
#include <random>
#include <string>

namespace core::fs {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Generates a short random suffix for temporary file names.
static std::string random_suffix()
{
    static constexpr char CHARS[] =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr int SUFFIX_LEN = 8;

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(
        0, static_cast<int>(sizeof(CHARS) - 2));

    std::string suffix;
    suffix.reserve(SUFFIX_LEN);
    for (int i = 0; i < SUFFIX_LEN; ++i) {
        suffix.push_back(CHARS[dist(rng)]);
    }
    return suffix;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool dir_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_directory(p, ec);
}

std::optional<uint64_t> file_size(const path& p)
{
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sz);
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

std::optional<Bytes> read_file(const path& p)
{
    std::ifstream ifs(p, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        return std::nullopt;
    }

    auto size = ifs.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    ifs.seekg(0, std::ios::beg);

    Bytes content(static_cast<size_t>(size));
    if (size > 0 &&
        !ifs.read(reinterpret_cast<char*>(content.data()), size)) {
        return std::nullopt;
    }
    return content;
}

std::optional<std::vector<path>> list_files(const path& dir, bool recursive)
{
    std::error_code ec;
    std::vector<path> files;

    auto collect = [&](const std::filesystem::directory_entry& entry) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path().lexically_relative(dir));
        }
    };

    if (recursive) {
        std::filesystem::recursive_directory_iterator it(dir, ec);
        if (ec) return std::nullopt;
        for (std::filesystem::recursive_directory_iterator end; it != end;
             it.increment(ec)) {
            if (ec) return std::nullopt;
            collect(*it);
        }
    } else {
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) return std::nullopt;
        for (std::filesystem::directory_iterator end; it != end;
             it.increment(ec)) {
            if (ec) return std::nullopt;
            collect(*it);
        }
    }

    // Directory iteration order is unspecified; sort so that the same tree
    // always yields the same block order on every platform.
    std::sort(files.begin(), files.end(),
              [](const path& a, const path& b) {
                  return a.generic_string() < b.generic_string();
              });
    return files;
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::create_directories(dir, ec) || !ec;
}

bool write_file(const path& p, ByteSpan content)
{
    if (p.has_parent_path() && !ensure_directory(p.parent_path())) {
        return false;
    }

    path tmp = p.parent_path() /
               (p.filename().string() + ".tmp." + random_suffix());
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return false;
        }
        ofs.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace core::fs
