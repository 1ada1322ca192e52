// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hasher.h"

#include "core/logging.h"
#include "crypto/openssl_sha256.h"
#include "crypto/sha256.h"

#include <string>
#include <utility>

namespace crypto {

core::Bytes Sha256Hasher::hash(core::ByteSpan data) const {
    core::uint256 digest = (engine_ == Sha256Engine::REFERENCE)
                               ? sha256_reference(data)
                               : sha256_accelerated(data);
    return digest.to_bytes();
}

core::Bytes OpensslSha256Hasher::hash(core::ByteSpan data) const {
    return openssl_sha256(data).to_bytes();
}

std::optional<Sha256Engine> parse_sha256_engine(std::string_view name) {
    if (name == "auto")      return Sha256Engine::AUTO;
    if (name == "reference") return Sha256Engine::REFERENCE;
    return std::nullopt;
}

core::Result<std::unique_ptr<Hasher>> make_hasher(std::string_view name,
                                                  Sha256Engine engine) {
    std::unique_ptr<Hasher> hasher;
    if (name == "sha256") {
        hasher = std::make_unique<Sha256Hasher>(engine);
        LOG_DEBUG(core::LogCategory::HASH,
                  std::string("sha256 engine: ") +
                  (engine == Sha256Engine::AUTO &&
                           sha256_accelerated_available()
                       ? "sha-ni"
                       : "portable"));
    } else if (name == "openssl") {
        hasher = std::make_unique<OpensslSha256Hasher>();
    } else {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "unknown hasher '" + std::string{name} +
                                "' (expected sha256 or openssl)");
    }
    return core::Result<std::unique_ptr<Hasher>>(std::move(hasher));
}

}  // namespace crypto
