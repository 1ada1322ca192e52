#pragma once
// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logger setup for the fsguard executables.
//
// Reads from core::Config:
//   loglevel        trace|debug|info|warn|error|fatal|off   (default warn)
//   logcategories   comma list of hash,merkle,proof,io,config,cli,bench,
//                   all,none                                (default all)
//   logfile         append log lines to this file as well
// Console output always goes to stderr so stdout carries only results.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"

#include <string>

namespace guard {

/// Configures core::Logger from @p config.  An unknown level or category
/// is CONFIG_RANGE; a log file that cannot be opened is IO_ERROR.
[[nodiscard]] core::Result<void> init_logging(const core::Config& config);

/// One-line version and build description, logged at DEBUG on startup.
[[nodiscard]] std::string get_startup_banner();

}  // namespace guard
