#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Hasher -- the hashing capability injected into MerkleTree.
//
// A hasher maps any byte sequence to a digest whose length is fixed for the
// instance (digest_size()).  The tree only ever calls hash(), so any
// algorithm can be plugged in.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/types.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace crypto {

class Hasher {
public:
    virtual ~Hasher() = default;

    /// Digest of @p data.  Must be deterministic and exactly
    /// digest_size() bytes long.
    [[nodiscard]] virtual core::Bytes hash(core::ByteSpan data) const = 0;

    [[nodiscard]] virtual std::size_t digest_size() const noexcept = 0;

    /// Short identifier used in logs and on the command line.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Which SHA-256 compression back-end Sha256Hasher uses.
enum class Sha256Engine {
    AUTO,       // SHA-NI when available, else portable
    REFERENCE,  // always the portable rounds
};

/// Hasher over the from-scratch SHA-256 engine.
class Sha256Hasher final : public Hasher {
public:
    explicit Sha256Hasher(Sha256Engine engine = Sha256Engine::AUTO) noexcept
        : engine_(engine) {}

    [[nodiscard]] core::Bytes hash(core::ByteSpan data) const override;
    [[nodiscard]] std::size_t digest_size() const noexcept override {
        return 32;
    }
    [[nodiscard]] std::string_view name() const noexcept override {
        return "sha256";
    }

    [[nodiscard]] Sha256Engine engine() const noexcept { return engine_; }

private:
    Sha256Engine engine_;
};

/// Hasher over OpenSSL's SHA-256.
class OpensslSha256Hasher final : public Hasher {
public:
    [[nodiscard]] core::Bytes hash(core::ByteSpan data) const override;
    [[nodiscard]] std::size_t digest_size() const noexcept override {
        return 32;
    }
    [[nodiscard]] std::string_view name() const noexcept override {
        return "openssl";
    }
};

/// Parses "auto" or "reference".
[[nodiscard]] std::optional<Sha256Engine> parse_sha256_engine(
    std::string_view name);

/// Creates the hasher named @p name ("sha256" or "openssl").  An unknown
/// name is CONFIG_RANGE.
[[nodiscard]] core::Result<std::unique_ptr<Hasher>> make_hasher(
    std::string_view name, Sha256Engine engine = Sha256Engine::AUTO);

}  // namespace crypto
