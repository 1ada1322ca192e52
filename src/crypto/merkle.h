#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "core/types.h"
#include "crypto/hasher.h"

namespace crypto {

/// Sibling digests from a leaf up to (not including) the root, one per
/// level, leaf side first.
using MerkleProof = std::vector<core::Bytes>;

/// One vertex of the tree.  Children are indices into the level below;
/// a duplicated odd node has left == right.
struct MerkleNode {
    core::Bytes digest;
    std::optional<std::size_t> left;
    std::optional<std::size_t> right;

    [[nodiscard]] bool is_leaf() const noexcept { return !left && !right; }
};

// Parent digest of two siblings: the pair is sorted bytewise and the
// concatenation lo || hi is hashed, so combine(a, b) == combine(b, a).
core::Bytes combine_canonical(const Hasher& hasher,
                              core::ByteSpan a, core::ByteSpan b);

// Recompute the root from raw leaf data and a proof and compare it with
// expected_root.  Needs no tree, only the same hasher.
bool verify_merkle_proof(const Hasher& hasher,
                         core::ByteSpan leaf_data,
                         const MerkleProof& proof,
                         core::ByteSpan expected_root);

class MerkleTree {
public:
    // Uses Sha256Hasher.
    MerkleTree();
    explicit MerkleTree(std::unique_ptr<Hasher> hasher);

    MerkleTree(MerkleTree&&) noexcept = default;
    MerkleTree& operator=(MerkleTree&&) noexcept = default;
    MerkleTree(const MerkleTree&) = delete;
    MerkleTree& operator=(const MerkleTree&) = delete;

    // Replace the whole tree with one built over blocks (in order).
    void build(const std::vector<core::Bytes>& blocks);
    void build(std::span<const core::ByteSpan> blocks);

    // nullopt iff the tree holds no leaves.
    std::optional<core::Bytes> root() const;

    // nullopt if index >= leaf_count().
    std::optional<MerkleProof> generate_proof(std::size_t index) const;

    bool verify_proof(core::ByteSpan leaf_data,
                      const MerkleProof& proof,
                      core::ByteSpan expected_root) const;

    std::size_t leaf_count() const noexcept;

    // Number of levels above the leaves (0 for a single leaf or no leaves).
    std::size_t depth() const noexcept;

    bool empty() const noexcept { return levels_.empty(); }

    std::optional<core::Bytes> leaf(std::size_t index) const;

    // Level 0 holds the leaves, level depth() holds the root.
    const MerkleNode* node(std::size_t level, std::size_t index) const noexcept;

    const Hasher& hasher() const noexcept { return *hasher_; }

private:
    std::unique_ptr<Hasher> hasher_;
    std::vector<std::vector<MerkleNode>> levels_;

    core::Bytes hash_checked(core::ByteSpan data) const;
};

}  // namespace crypto
