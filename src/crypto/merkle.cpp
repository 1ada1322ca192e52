// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/merkle.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/hex.h"
#include "core/logging.h"

namespace crypto {

namespace {

bool bytes_less(core::ByteSpan a, core::ByteSpan b) {
    return std::lexicographical_compare(a.begin(), a.end(),
                                        b.begin(), b.end());
}

bool bytes_equal(core::ByteSpan a, core::ByteSpan b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

// Sibling of idx within a level of size count.  The last node of an odd
// level is its own sibling.
std::size_t sibling_index(std::size_t idx, std::size_t count) {
    if (idx % 2 == 0) {
        return (idx + 1 < count) ? idx + 1 : idx;
    }
    return idx - 1;
}

}  // namespace

core::Bytes combine_canonical(const Hasher& hasher,
                              core::ByteSpan a, core::ByteSpan b) {
    if (bytes_less(b, a)) {
        std::swap(a, b);
    }
    core::Bytes combined;
    combined.reserve(a.size() + b.size());
    combined.insert(combined.end(), a.begin(), a.end());
    combined.insert(combined.end(), b.begin(), b.end());
    return hasher.hash(combined);
}

bool verify_merkle_proof(const Hasher& hasher,
                         core::ByteSpan leaf_data,
                         const MerkleProof& proof,
                         core::ByteSpan expected_root) {
    core::Bytes current = hasher.hash(leaf_data);
    LOG_TRACE(core::LogCategory::PROOF,
              "verify: leaf digest " + core::to_hex(current));

    for (std::size_t level = 0; level < proof.size(); ++level) {
        current = combine_canonical(hasher, current, proof[level]);
        LOG_TRACE(core::LogCategory::PROOF,
                  "verify: level " + std::to_string(level + 1) + " -> " +
                  core::to_hex(current));
    }

    bool ok = bytes_equal(current, expected_root);
    LOG_TRACE(core::LogCategory::PROOF,
              std::string("verify: ") + (ok ? "root matches" : "root mismatch"));
    return ok;
}

MerkleTree::MerkleTree()
    : hasher_(std::make_unique<Sha256Hasher>()) {}

MerkleTree::MerkleTree(std::unique_ptr<Hasher> hasher)
    : hasher_(std::move(hasher)) {
    if (!hasher_) {
        throw std::invalid_argument("MerkleTree: hasher must not be null");
    }
}

core::Bytes MerkleTree::hash_checked(core::ByteSpan data) const {
    core::Bytes digest = hasher_->hash(data);
    if (digest.size() != hasher_->digest_size()) {
        throw std::logic_error(
            "MerkleTree: hasher '" + std::string(hasher_->name()) +
            "' returned " + std::to_string(digest.size()) +
            " bytes, expected " + std::to_string(hasher_->digest_size()));
    }
    return digest;
}

void MerkleTree::build(const std::vector<core::Bytes>& blocks) {
    std::vector<core::ByteSpan> views(blocks.begin(), blocks.end());
    build(std::span<const core::ByteSpan>(views));
}

void MerkleTree::build(std::span<const core::ByteSpan> blocks) {
    std::vector<std::vector<MerkleNode>> levels;

    if (!blocks.empty()) {
        std::vector<MerkleNode> leaves;
        leaves.reserve(blocks.size());
        for (const auto& block : blocks) {
            leaves.push_back(MerkleNode{hash_checked(block), {}, {}});
        }
        levels.push_back(std::move(leaves));

        // Pair left to right; an odd tail is paired with itself.
        while (levels.back().size() > 1) {
            const auto& below = levels.back();
            const std::size_t count = below.size();

            std::vector<MerkleNode> next;
            next.reserve((count + 1) / 2);
            for (std::size_t i = 0; i < count; i += 2) {
                std::size_t j = sibling_index(i, count);
                core::Bytes combined = combine_canonical(
                    *hasher_, below[i].digest, below[j].digest);
                if (combined.size() != hasher_->digest_size()) {
                    throw std::logic_error(
                        "MerkleTree: hasher returned a digest of the wrong "
                        "size for an internal node");
                }
                next.push_back(MerkleNode{std::move(combined), i, j});
            }
            levels.push_back(std::move(next));
        }
    }

    levels_ = std::move(levels);

    LOG_DEBUG(core::LogCategory::MERKLE,
              "built tree over " + std::to_string(leaf_count()) +
              " leaves, depth " + std::to_string(depth()) +
              " (" + std::string(hasher_->name()) + ")");
}

std::optional<core::Bytes> MerkleTree::root() const {
    if (levels_.empty()) {
        return std::nullopt;
    }
    return levels_.back().front().digest;
}

std::optional<MerkleProof> MerkleTree::generate_proof(std::size_t index) const {
    if (index >= leaf_count()) {
        LOG_TRACE(core::LogCategory::PROOF,
                  "proof: index " + std::to_string(index) +
                  " out of range (" + std::to_string(leaf_count()) +
                  " leaves)");
        return std::nullopt;
    }

    MerkleProof proof;
    proof.reserve(depth());

    std::size_t idx = index;
    for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];
        std::size_t sib = sibling_index(idx, nodes.size());
        proof.push_back(nodes[sib].digest);
        LOG_TRACE(core::LogCategory::PROOF,
                  "proof: level " + std::to_string(level) + " node " +
                  std::to_string(idx) + " sibling " + std::to_string(sib) +
                  " " + core::to_hex(nodes[sib].digest));
        idx /= 2;
    }

    return proof;
}

bool MerkleTree::verify_proof(core::ByteSpan leaf_data,
                              const MerkleProof& proof,
                              core::ByteSpan expected_root) const {
    return verify_merkle_proof(*hasher_, leaf_data, proof, expected_root);
}

std::size_t MerkleTree::leaf_count() const noexcept {
    return levels_.empty() ? 0 : levels_.front().size();
}

std::size_t MerkleTree::depth() const noexcept {
    return levels_.empty() ? 0 : levels_.size() - 1;
}

std::optional<core::Bytes> MerkleTree::leaf(std::size_t index) const {
    if (index >= leaf_count()) {
        return std::nullopt;
    }
    return levels_.front()[index].digest;
}

const MerkleNode* MerkleTree::node(std::size_t level,
                                   std::size_t index) const noexcept {
    if (level >= levels_.size() || index >= levels_[level].size()) {
        return nullptr;
    }
    return &levels_[level][index];
}

}  // namespace crypto
