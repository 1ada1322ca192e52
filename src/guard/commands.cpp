// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "guard/commands.h"

#include "core/fs.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/types.h"
#include "crypto/merkle.h"
#include "guard/version.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace guard {

namespace {

std::string join_hex(const crypto::MerkleProof& proof) {
    std::string joined;
    for (std::size_t i = 0; i < proof.size(); ++i) {
        if (i > 0) joined += ',';
        joined += core::to_hex(proof[i]);
    }
    return joined;
}

core::Result<core::Bytes> read_regular_file(const std::string& path) {
    if (!core::fs::file_exists(path)) {
        if (core::fs::dir_exists(path)) {
            return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                    path + " is a directory");
        }
        return core::make_error(core::ErrorCode::IO_NOT_FOUND,
                                "no such file: " + path);
    }
    auto content = core::fs::read_file(path);
    if (!content) {
        return core::make_error(core::ErrorCode::IO_READ,
                                "cannot read " + path);
    }
    return std::move(*content);
}

// Exactly one of file_key / text_key must be set.
core::Result<core::Bytes> read_data_option(const core::Config& config,
                                           const char* file_key,
                                           const char* text_key) {
    bool have_file = config.has(file_key);
    bool have_text = config.has(text_key);
    if (have_file && have_text) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                std::string("-") + file_key + " and -" +
                                text_key + " are mutually exclusive");
    }
    if (have_text) {
        std::string text = config.get_or(text_key, "");
        return core::Bytes(text.begin(), text.end());
    }
    if (!have_file) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                std::string("missing -") + file_key +
                                " or -" + text_key);
    }
    FSG_TRY_ASSIGN(path, config.require(file_key));
    return read_regular_file(path);
}

core::Result<core::Bytes> require_hex(const core::Config& config,
                                      const char* key) {
    FSG_TRY_ASSIGN(text, config.require(key));
    auto bytes = core::from_hex(text);
    if (!bytes) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                std::string("-") + key +
                                " is not valid hex: '" + text + "'");
    }
    return std::move(*bytes);
}

// Loads the blocks named by the config and builds a tree over them.
core::Result<crypto::MerkleTree> build_tree(const core::Config& config) {
    FSG_TRY_ASSIGN(hasher, hasher_from_config(config));
    FSG_TRY_ASSIGN(opts, ingest_options_from_config(config));
    FSG_TRY_ASSIGN(blocks, collect_blocks(opts));

    if (blocks.empty()) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
                                opts.path.string() +
                                " holds no blocks; the tree has no root");
    }

    crypto::MerkleTree tree(std::move(hasher));
    tree.build(blocks);

    if (core::Logger::instance().will_log(core::LogLevel::INFO,
                                          core::LogCategory::MERKLE)) {
        auto names = collect_block_names(opts);
        for (std::size_t i = 0; i < tree.leaf_count(); ++i) {
            std::string label = (names.ok() && i < names.value().size())
                                    ? names.value()[i]
                                    : std::to_string(i);
            LOG_INFO(core::LogCategory::MERKLE,
                     "leaf " + std::to_string(i) + " " +
                     core::to_hex(*tree.leaf(i)) + " " + label);
        }
    }
    return core::Result<crypto::MerkleTree>(std::move(tree));
}

}  // namespace

core::Result<std::unique_ptr<crypto::Hasher>>
hasher_from_config(const core::Config& config) {
    std::string engine_name = config.get_or(core::CONF_ENGINE, "auto");
    auto engine = crypto::parse_sha256_engine(engine_name);
    if (!engine) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "unknown -engine '" + engine_name +
                                "' (expected auto or reference)");
    }
    return crypto::make_hasher(config.get_or(core::CONF_HASHER, "sha256"),
                               *engine);
}

core::Result<IngestOptions> ingest_options_from_config(
    const core::Config& config) {
    IngestOptions opts;
    FSG_TRY_ASSIGN(input, config.require(core::CONF_INPUT));
    FSG_TRY_ASSIGN(block_size, config.get_uint(core::CONF_BLOCKSIZE, 0));
    opts.path = input;
    opts.block_size = static_cast<std::size_t>(block_size);
    opts.recursive = config.get_bool(core::CONF_RECURSIVE);
    return opts;
}

core::Result<void> cmd_hash(const core::Config& config, std::ostream& out) {
    FSG_TRY_ASSIGN(hasher, hasher_from_config(config));
    FSG_TRY_ASSIGN(data, read_data_option(config, core::CONF_INPUT,
                                          core::CONF_TEXT));
    core::Bytes digest = hasher->hash(data);
    LOG_DEBUG(core::LogCategory::HASH,
              std::string(hasher->name()) + " over " +
              std::to_string(data.size()) + " bytes");
    out << core::to_hex(digest) << "\n";
    return core::make_ok();
}

core::Result<void> cmd_root(const core::Config& config, std::ostream& out) {
    FSG_TRY_ASSIGN(tree, build_tree(config));
    out << core::to_hex(*tree.root()) << "\n";
    return core::make_ok();
}

core::Result<void> cmd_proof(const core::Config& config, std::ostream& out) {
    if (!config.has(core::CONF_INDEX)) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                "missing required option -index");
    }
    FSG_TRY_ASSIGN(index, config.get_uint(core::CONF_INDEX, 0));
    FSG_TRY_ASSIGN(tree, build_tree(config));

    auto proof = tree.generate_proof(static_cast<std::size_t>(index));
    if (!proof) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "-index=" + std::to_string(index) +
                                " out of range (" +
                                std::to_string(tree.leaf_count()) +
                                " leaves)");
    }

    out << "root  " << core::to_hex(*tree.root()) << "\n"
        << "leaf  " << core::to_hex(*tree.leaf(index)) << "\n"
        << "proof " << join_hex(*proof) << "\n";
    return core::make_ok();
}

core::Result<VerifyStatus> cmd_verify(const core::Config& config,
                                      std::ostream& out) {
    FSG_TRY_ASSIGN(hasher, hasher_from_config(config));
    FSG_TRY_ASSIGN(leaf, read_data_option(config, core::CONF_LEAF,
                                          core::CONF_LEAFTEXT));
    FSG_TRY_ASSIGN(root, require_hex(config, core::CONF_ROOT));

    // An empty -proof is valid: a single-leaf tree has no siblings.
    std::string proof_text = config.get_or(core::CONF_PROOF, "");
    auto proof = core::from_hex_list(proof_text);
    if (!proof) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "-proof is not a comma-separated hex list");
    }

    bool ok = crypto::verify_merkle_proof(*hasher, leaf, *proof, root);
    LOG_INFO(core::LogCategory::PROOF,
             std::string("proof with ") + std::to_string(proof->size()) +
             " siblings " + (ok ? "matches" : "does not match") + " root");
    out << (ok ? "valid" : "invalid") << "\n";
    return ok ? VerifyStatus::VALID : VerifyStatus::INVALID;
}

core::Result<void> cmd_demo(const core::Config& config, std::ostream& out) {
    FSG_TRY_ASSIGN(hasher, hasher_from_config(config));

    core::Bytes hello = hasher->hash(core::as_bytes("hello world"));
    out << "SHA-256(\"hello world\") = " << core::to_hex(hello) << "\n";

    std::vector<core::Bytes> blocks;
    for (const char* text : {"block1", "block2", "block3", "block4"}) {
        core::ByteSpan view = core::as_bytes(text);
        blocks.emplace_back(view.begin(), view.end());
    }

    crypto::MerkleTree tree(std::move(hasher));
    tree.build(blocks);
    out << "Merkle root = " << core::to_hex(*tree.root()) << "\n";

    auto proof = tree.generate_proof(0);
    if (!proof) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                "no proof for leaf 0 of a 4-leaf tree");
    }
    out << "Proof for block1:\n";
    for (const auto& sibling : *proof) {
        out << "  " << core::to_hex(sibling) << "\n";
    }

    bool ok = tree.verify_proof(blocks[0], *proof, *tree.root());
    out << "Proof valid: " << (ok ? "true" : "false") << "\n";
    if (!ok) {
        return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                "demo proof failed to verify");
    }
    return core::make_ok();
}

core::Result<int> run_command(const core::Config& config, std::ostream& out) {
    const auto& args = config.positional();
    if (args.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "no command given (try -help)");
    }
    const std::string& command = args.front();
    LOG_DEBUG(core::LogCategory::CLI, "command: " + command);

    if (command == "hash") {
        FSG_TRY_VOID(cmd_hash(config, out));
    } else if (command == "root") {
        FSG_TRY_VOID(cmd_root(config, out));
    } else if (command == "proof") {
        FSG_TRY_VOID(cmd_proof(config, out));
    } else if (command == "verify") {
        FSG_TRY_ASSIGN(status, cmd_verify(config, out));
        if (status == VerifyStatus::INVALID) {
            return EXIT_PROOF_INVALID;
        }
    } else if (command == "demo") {
        FSG_TRY_VOID(cmd_demo(config, out));
    } else {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "unknown command '" + command +
                                "' (try -help)");
    }
    return EXIT_OK;
}

void print_usage(std::ostream& out) {
    out << get_client_name() << "\n\n"
        << "Usage: fsguard <command> [-key=value ...]\n"
           "\n"
           "Commands:\n"
           "  hash    -input=PATH | -text=STRING\n"
           "          Print the digest of a file or a literal string.\n"
           "  root    -input=PATH [-blocksize=N] [-recursive]\n"
           "          Print the Merkle root over a file's chunks or a\n"
           "          directory's files.\n"
           "  proof   -input=PATH -index=N [-blocksize=N] [-recursive]\n"
           "          Print the root, the leaf digest and the inclusion\n"
           "          proof for block N.\n"
           "  verify  -leaf=PATH | -leaftext=STRING -proof=HEX[,HEX...]\n"
           "          -root=HEX\n"
           "          Check an inclusion proof.  Exit code 2 if it fails.\n"
           "  demo    Hash \"hello world\" and prove block1 in a 4-block\n"
           "          tree.\n"
           "\n"
           "Options:\n"
           "  -hasher=sha256|openssl     Digest implementation (sha256)\n"
           "  -engine=auto|reference     SHA-256 back-end (auto)\n"
           "  -loglevel=LEVEL            trace, debug, info, warn, error,\n"
           "                             off (warn)\n"
           "  -logcategories=LIST        hash,merkle,proof,io,config,cli\n"
           "  -logfile=PATH              Also append log lines to PATH\n"
           "  -conf=PATH                 Read key=value options from PATH\n"
           "  -help                      Show this message\n";
}

}  // namespace guard
