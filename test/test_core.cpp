// Copyright (c) 2025-2026 The fsguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"
#include "test_util.h"

#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// Types -- uint256
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint256_from_hex_keeps_digest_order) {
    std::string hex =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    auto val = core::uint256::from_hex(hex);
    CHECK_EQ(val.data()[0], 0xba);
    CHECK_EQ(val.data()[31], 0xad);
    CHECK_EQ(val.to_hex(), hex);
}

TEST_CASE(Types, uint256_from_hex_with_prefix) {
    auto val = core::uint256::from_hex(
        "0XE3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
    CHECK_EQ(val.to_hex(),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(Types, uint256_from_hex_rejects_bad_input) {
    CHECK_THROWS(core::uint256::from_hex("abcd"), std::invalid_argument);
    CHECK_THROWS(
        core::uint256::from_hex(
            "zz00000000000000000000000000000000000000000000000000000000000000"),
        std::invalid_argument);
}

TEST_CASE(Types, uint256_from_bytes) {
    std::array<uint8_t, 32> bytes{};
    bytes[0] = 0x01;
    auto val = core::uint256::from_bytes(std::span<const uint8_t, 32>(bytes));
    CHECK(!val.is_zero());
    CHECK_EQ(val.to_hex().substr(0, 4), "0100");
    CHECK(val.to_bytes() == core::Bytes(bytes.begin(), bytes.end()));
}

TEST_CASE(Types, uint256_ordering_is_lexicographic) {
    auto a = core::uint256::from_hex(
        "00ff000000000000000000000000000000000000000000000000000000000000");
    auto b = core::uint256::from_hex(
        "0100000000000000000000000000000000000000000000000000000000000000");
    CHECK(a < b);
    CHECK(b > a);
    CHECK(a != b);
    CHECK(a == core::uint256::from_hex(a.to_hex()));
}

TEST_CASE(Types, as_bytes_views_string) {
    auto view = core::as_bytes("abc");
    CHECK_EQ(view.size(), 3u);
    CHECK_EQ(view[0], 'a');
    CHECK_EQ(view[2], 'c');
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, encode) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    CHECK_EQ(core::to_hex(data), "000fa5ff");
    CHECK_EQ(core::to_hex(std::vector<uint8_t>{}), "");
}

TEST_CASE(Hex, decode_mixed_case_and_prefix) {
    auto a = core::from_hex("DeadBEEF");
    CHECK(a.has_value());
    CHECK(*a == (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));

    auto b = core::from_hex("0xdeadbeef");
    CHECK(b.has_value());
    CHECK(*a == *b);

    auto empty = core::from_hex("");
    CHECK(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE(Hex, decode_rejects_malformed) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zz").has_value());
    CHECK(!core::from_hex("12 4").has_value());
    CHECK(!core::from_hex("0x1").has_value());
}

TEST_CASE(Hex, is_hex) {
    CHECK(core::is_hex("00ff"));
    CHECK(core::is_hex(""));
    CHECK(!core::is_hex("0"));
    CHECK(!core::is_hex("0g"));
}

TEST_CASE(Hex, decode_list) {
    auto list = core::from_hex_list("aa,bbcc,,dd");
    CHECK(list.has_value());
    CHECK_EQ(list->size(), 3u);
    CHECK((*list)[1] == (std::vector<uint8_t>{0xbb, 0xcc}));

    auto none = core::from_hex_list("");
    CHECK(none.has_value());
    CHECK(none->empty());

    CHECK(!core::from_hex_list("aa,xyz").has_value());
    CHECK(!core::from_hex_list("aa;bb", ',').has_value());
    CHECK(core::from_hex_list("aa;bb", ';').has_value());
}

// ============================================================================
// Error / Result
// ============================================================================

namespace {

core::Result<int> parse_positive(int v) {
    if (v <= 0) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "not positive");
    }
    return v;
}

core::Result<int> doubled(int v) {
    FSG_TRY_ASSIGN(p, parse_positive(v));
    return p * 2;
}

core::Result<int> tripled(int v) {
    int p = FSG_TRY(parse_positive(v));
    return p * 3;
}

core::Result<void> require_positive(int v) {
    if (v <= 0) {
        return core::make_error(core::ErrorCode::CONFIG_RANGE,
                                "not positive");
    }
    return core::make_ok();
}

core::Result<void> check_positive(int v) {
    FSG_TRY_VOID(require_positive(v));
    return core::make_ok();
}

}  // namespace

TEST_CASE(Error, result_holds_value_or_error) {
    core::Result<int> ok = 7;
    CHECK(ok.ok());
    CHECK_EQ(ok.value(), 7);
    CHECK_THROWS(ok.error(), std::runtime_error);

    core::Result<int> bad = core::make_error(core::ErrorCode::IO_READ, "x");
    CHECK(!bad.ok());
    CHECK(bad.error().code() == core::ErrorCode::IO_READ);
    CHECK_EQ(bad.value_or(3), 3);
    CHECK_THROWS(bad.value(), std::runtime_error);
}

TEST_CASE(Error, try_macros_propagate) {
    CHECK_EQ(doubled(4).value(), 8);
    CHECK_ERR_CODE(doubled(-1), core::ErrorCode::CONFIG_RANGE);

    CHECK_EQ(tripled(2).value(), 6);
    CHECK_ERR_CODE(tripled(0), core::ErrorCode::CONFIG_RANGE);

    CHECK_OK(check_positive(1));
    CHECK_ERR(check_positive(-5));
}

TEST_CASE(Error, format_names_code_and_location) {
    auto err = core::make_error(core::ErrorCode::IO_NOT_FOUND, "missing.txt");
    std::string text = err.format();
    CHECK(text.find("IO_NOT_FOUND(301)") != std::string::npos);
    CHECK(text.find("missing.txt") != std::string::npos);
    CHECK(text.find("test_core.cpp") != std::string::npos);

    CHECK_EQ(core::Error().format(), "no error");
    CHECK_EQ(core::error_code_name(core::ErrorCode::PARSE_BAD_FORMAT),
             "PARSE_BAD_FORMAT");
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_forms) {
    const char* argv[] = {"fsguard", "proof",   "-input=data.bin",
                          "--index=3", "-recursive", "extra",
                          "-input=other.bin"};
    core::Config cfg;
    cfg.parse_args(7, argv);

    CHECK_EQ(cfg.positional().size(), 2u);
    CHECK_EQ(cfg.positional()[0], "proof");
    CHECK_EQ(cfg.positional()[1], "extra");

    // Last occurrence wins for scalar lookups.
    CHECK_EQ(cfg.get_or(core::CONF_INPUT, ""), "other.bin");
    CHECK_EQ(cfg.get_list(core::CONF_INPUT).size(), 2u);
    CHECK(cfg.get_bool(core::CONF_RECURSIVE));
    CHECK_EQ(cfg.get_uint(core::CONF_INDEX).value(), 3u);
    CHECK(!cfg.has(core::CONF_ROOT));
}

TEST_CASE(Config, get_uint_rejects_garbage) {
    const char* argv[] = {"fsguard", "-blocksize=12k", "-index=-1"};
    core::Config cfg;
    cfg.parse_args(3, argv);
    CHECK_ERR_CODE(cfg.get_uint(core::CONF_BLOCKSIZE),
                   core::ErrorCode::CONFIG_RANGE);
    CHECK_ERR_CODE(cfg.get_uint(core::CONF_INDEX),
                   core::ErrorCode::CONFIG_RANGE);
    CHECK_EQ(cfg.get_uint("absent", 42).value(), 42u);
}

TEST_CASE(Config, require_reports_missing) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.require(core::CONF_ROOT),
                   core::ErrorCode::CONFIG_MISSING);
    cfg.set_default(core::CONF_ROOT, "abcd");
    CHECK_EQ(cfg.require(core::CONF_ROOT).value(), "abcd");
}

TEST_CASE(Config, command_line_overrides_file_overrides_default) {
    test::TempDir dir;
    auto conf = dir.write("fsguard.conf",
                          "# comment\n"
                          "; another comment\n"
                          "[main]\n"
                          "hasher = openssl\n"
                          "blocksize=4096\n"
                          "recursive\n");

    const char* argv[] = {"fsguard", "-hasher=sha256"};
    core::Config cfg;
    cfg.parse_args(2, argv);
    cfg.set_default(core::CONF_HASHER, "default");
    cfg.set_default(core::CONF_BLOCKSIZE, "1");
    cfg.set_default(core::CONF_ENGINE, "reference");
    CHECK_OK(cfg.parse_file(conf));

    CHECK_EQ(cfg.get_or(core::CONF_HASHER, ""), "sha256");
    CHECK_EQ(cfg.get_uint(core::CONF_BLOCKSIZE).value(), 4096u);
    CHECK_EQ(cfg.get_or(core::CONF_ENGINE, ""), "reference");
    CHECK(cfg.get_bool(core::CONF_RECURSIVE));
    CHECK(!cfg.has("main"));
}

TEST_CASE(Config, parse_file_errors) {
    test::TempDir dir;
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file(dir.path() / "nope.conf"),
                   core::ErrorCode::IO_NOT_FOUND);

    auto bad = dir.write("bad.conf", "hasher=sha256\n = value\n");
    CHECK_ERR_CODE(cfg.parse_file(bad), core::ErrorCode::CONFIG_ERROR);
}

// ============================================================================
// Filesystem helpers
// ============================================================================

TEST_CASE(Fs, write_and_read_back) {
    test::TempDir dir;
    auto p = dir.path() / "sub" / "file.bin";
    std::vector<uint8_t> data = {0, 1, 2, 255};
    CHECK(core::fs::write_file(p, data));
    CHECK(core::fs::file_exists(p));
    CHECK_EQ(core::fs::file_size(p).value_or(0), 4u);

    auto back = core::fs::read_file(p);
    CHECK(back.has_value());
    CHECK(*back == data);

    CHECK(!core::fs::read_file(dir.path() / "missing").has_value());
}

TEST_CASE(Fs, list_files_sorted_and_relative) {
    test::TempDir dir;
    dir.write("b.txt", "b");
    dir.write("a.txt", "a");
    dir.write("nested/c.txt", "c");

    auto flat = core::fs::list_files(dir.path(), false);
    CHECK(flat.has_value());
    CHECK_EQ(flat->size(), 2u);
    CHECK_EQ((*flat)[0].generic_string(), "a.txt");
    CHECK_EQ((*flat)[1].generic_string(), "b.txt");

    auto deep = core::fs::list_files(dir.path(), true);
    CHECK(deep.has_value());
    CHECK_EQ(deep->size(), 3u);
    CHECK_EQ((*deep)[2].generic_string(), "nested/c.txt");

    CHECK(!core::fs::list_files(dir.path() / "absent", false).has_value());
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_level_names) {
    CHECK(core::parse_log_level("trace") == core::LogLevel::TRACE);
    CHECK(core::parse_log_level("WARNING") == core::LogLevel::WARN);
    CHECK(core::parse_log_level(" error ") == core::LogLevel::ERR);
    CHECK(!core::parse_log_level("loud").has_value());
    CHECK_EQ(core::log_level_string(core::LogLevel::ERR), "ERROR");
}

TEST_CASE(Logging, parse_category_lists) {
    auto cats = core::parse_log_categories("merkle, proof");
    CHECK(cats.has_value());
    CHECK(*cats == (core::LogCategory::MERKLE | core::LogCategory::PROOF));
    CHECK(core::parse_log_categories("all") == core::LogCategory::ALL);
    CHECK(core::parse_log_categories("") == core::LogCategory::NONE);
    CHECK(!core::parse_log_categories("merkle,network").has_value());
    CHECK_EQ(core::log_category_string(core::LogCategory::PROOF), "PROOF");
}

TEST_CASE(Logging, filters_by_level_and_category) {
    auto& logger = core::Logger::instance();
    std::ostringstream sink;
    logger.set_console_stream(&sink);
    logger.set_print_to_console(true);
    logger.set_level(core::LogLevel::DEBUG);
    logger.set_categories(core::LogCategory::MERKLE);

    CHECK(logger.will_log(core::LogLevel::DEBUG, core::LogCategory::MERKLE));
    CHECK(!logger.will_log(core::LogLevel::TRACE, core::LogCategory::MERKLE));
    CHECK(!logger.will_log(core::LogLevel::ERR, core::LogCategory::IO));
    CHECK(logger.will_log(core::LogLevel::INFO, core::LogCategory::NONE));

    LOG_DEBUG(core::LogCategory::MERKLE, "visible line");
    LOG_DEBUG(core::LogCategory::IO, "hidden line");
    logger.flush();

    std::string out = sink.str();
    CHECK(out.find("[DEBUG] [MERKLE] visible line") != std::string::npos);
    CHECK(out.find("hidden line") == std::string::npos);

    logger.set_console_stream(nullptr);
    logger.set_categories(core::LogCategory::ALL);
    logger.set_level(core::LogLevel::OFF);
}
