#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// fsguard subcommands.  Each reads its options from a core::Config and
// writes results (hex, one item per line) to the given stream.  Failures
// come back as core::Error; diagnostics go through the logger.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "crypto/hasher.h"
#include "guard/ingest.h"

#include <memory>
#include <ostream>
#include <string_view>

namespace guard {

/// Process exit codes.
inline constexpr int EXIT_OK            = 0;
inline constexpr int EXIT_ERROR         = 1;
inline constexpr int EXIT_PROOF_INVALID = 2;

enum class VerifyStatus { VALID, INVALID };

/// Builds the hasher selected by -hasher and -engine.
[[nodiscard]] core::Result<std::unique_ptr<crypto::Hasher>>
hasher_from_config(const core::Config& config);

/// Reads -input, -blocksize and -recursive.
[[nodiscard]] core::Result<IngestOptions> ingest_options_from_config(
    const core::Config& config);

[[nodiscard]] core::Result<void> cmd_hash(const core::Config& config,
                                          std::ostream& out);
[[nodiscard]] core::Result<void> cmd_root(const core::Config& config,
                                          std::ostream& out);
[[nodiscard]] core::Result<void> cmd_proof(const core::Config& config,
                                           std::ostream& out);
[[nodiscard]] core::Result<VerifyStatus> cmd_verify(
    const core::Config& config, std::ostream& out);
[[nodiscard]] core::Result<void> cmd_demo(const core::Config& config,
                                          std::ostream& out);

/// Runs the command named by the first positional argument and returns
/// the exit code for a completed command (EXIT_OK or EXIT_PROOF_INVALID).
/// A missing or unknown command is CONFIG_ERROR.
[[nodiscard]] core::Result<int> run_command(const core::Config& config,
                                            std::ostream& out);

void print_usage(std::ostream& out);

}  // namespace guard
