// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/fs.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/random.h"
#include "core/serialize.h"
#include "core/signal.h"
#include "core/stream.h"
#include "core/time.h"
#include "core/types.h"
#include "core/work_queue.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() /
               ("pst_test_core_" + std::to_string(core::get_random_uint64()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

// ============================================================================
// Types
// ============================================================================

TEST_CASE(Types, uint160_default_is_zero) {
    core::uint160 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(), "0000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint160_hex_keeps_display_order) {
    std::string hex = "00112233445566778899aabbccddeeff01234567";
    auto id = core::uint160::from_hex(hex);
    CHECK_EQ(id.data()[0], 0x00);
    CHECK_EQ(id.data()[1], 0x11);
    CHECK_EQ(id.data()[19], 0x67);
    CHECK_EQ(id.to_hex(), hex);
    CHECK_EQ(core::uint160::from_hex("0x" + hex).to_hex(), hex);
}

TEST_CASE(Types, uint160_from_hex_rejects_malformed) {
    CHECK_THROWS(core::uint160::from_hex("abc"));
    CHECK_THROWS(core::uint160::from_hex("zz112233445566778899aabbccddeeff01234567"));
    // 32 bytes is a uint256, not an account.
    CHECK_THROWS(core::uint160::from_hex(
        "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff"));
}

TEST_CASE(Types, uint160_from_bytes) {
    std::array<uint8_t, 20> bytes{};
    bytes[19] = 0x01;
    auto id = core::uint160::from_bytes(std::span<const uint8_t, 20>(bytes));
    CHECK(!id.is_zero());
    CHECK_EQ(id.to_hex(), "0000000000000000000000000000000000000001");
}

TEST_CASE(Types, uint160_ordering_and_hash) {
    auto a = core::uint160::from_hex("0000000000000000000000000000000000000001");
    auto b = core::uint160::from_hex("0000000000000000000000000000000000000002");
    auto c = core::uint160::from_hex("0100000000000000000000000000000000000000");
    CHECK(a < b);
    CHECK(b < c);
    CHECK(a != b);
    CHECK(a == core::uint160::from_hex("0000000000000000000000000000000000000001"));

    std::hash<core::uint160> h;
    CHECK_EQ(h(a), h(core::uint160::from_hex("0000000000000000000000000000000000000001")));
}

TEST_CASE(Types, uint256_roundtrip) {
    std::string hex =
        "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a";
    auto v = core::uint256::from_hex(hex);
    CHECK_EQ(v.to_hex(), hex);
    CHECK_EQ(v.data()[0], 0xa7);
    CHECK(!v.is_zero());
    CHECK(core::uint256{}.is_zero());
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, to_hex_basic) {
    std::vector<uint8_t> data = {0xde, 0xad, 0xbe, 0xef};
    CHECK_EQ(core::to_hex(data), "deadbeef");
}

TEST_CASE(Hex, to_hex_empty) {
    std::vector<uint8_t> data;
    CHECK_EQ(core::to_hex(data), "");
}

TEST_CASE(Hex, from_hex_valid) {
    auto result = core::from_hex("DEADbeef");
    CHECK(result.has_value());
    CHECK_EQ(result->size(), 4u);
    CHECK_EQ((*result)[0], 0xde);
    CHECK_EQ((*result)[3], 0xef);

    auto prefixed = core::from_hex("0x0102");
    CHECK(prefixed.has_value());
    CHECK_EQ(prefixed->size(), 2u);
}

TEST_CASE(Hex, from_hex_invalid) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zzzz").has_value());
}

TEST_CASE(Hex, is_hex_checks) {
    CHECK(core::is_hex("0123456789abcdefABCDEF"));
    CHECK(!core::is_hex(""));
    CHECK(!core::is_hex("0g"));
    CHECK(!core::is_hex("abc"));  // odd length
    CHECK_EQ(core::hex_digit_value('f'), 15);
    CHECK_EQ(core::hex_digit_value('G'), -1);
}

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(ErrorResult, error_creation) {
    core::Error err(core::ErrorCode::PARSE_ERROR, "bad input");
    CHECK_EQ(err.code(), core::ErrorCode::PARSE_ERROR);
    CHECK_EQ(err.message(), "bad input");
    CHECK(!err.is_ok());
    CHECK(static_cast<bool>(err));  // explicit bool: true when not ok
}

TEST_CASE(ErrorResult, error_none_is_ok) {
    core::Error ok_err;
    CHECK(ok_err.is_ok());
    CHECK(!static_cast<bool>(ok_err));
    CHECK_EQ(ok_err.code(), core::ErrorCode::NONE);
}

TEST_CASE(ErrorResult, escrow_codes_have_names) {
    CHECK_EQ(core::error_code_name(core::ErrorCode::ESCROW_BAD_PASSWORD),
             "IncorrectPassword");
    CHECK_EQ(core::error_code_name(core::ErrorCode::ESCROW_COOLDOWN_ELAPSED),
             "CooldownElapsed");
    auto formatted = core::make_error(core::ErrorCode::ESCROW_NOT_FOUND,
                                      "transfer #9").format();
    CHECK(formatted.find("transfer #9") != std::string::npos);
}

TEST_CASE(ErrorResult, result_with_value) {
    core::Result<int> r = 42;
    CHECK(r.ok());
    CHECK_EQ(r.value(), 42);
}

TEST_CASE(ErrorResult, result_with_error) {
    core::Result<int> r = core::Error(core::ErrorCode::PARSE_ERROR, "fail");
    CHECK(!r.ok());
    CHECK_EQ(r.error().code(), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(ErrorResult, result_value_or) {
    core::Result<int> good = 42;
    core::Result<int> bad = core::Error(core::ErrorCode::INTERNAL_ERROR, "x");
    CHECK_EQ(good.value_or(0), 42);
    CHECK_EQ(bad.value_or(-1), -1);
}

TEST_CASE(ErrorResult, result_map) {
    core::Result<int> r = 10;
    auto mapped = r.map([](int v) { return v * 2; });
    CHECK(mapped.ok());
    CHECK_EQ(mapped.value(), 20);

    core::Result<int> err = core::Error(core::ErrorCode::PARSE_ERROR, "e");
    auto mapped_err = err.map([](int v) { return v * 2; });
    CHECK(!mapped_err.ok());
    CHECK_EQ(mapped_err.error().code(), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(ErrorResult, result_and_then) {
    core::Result<int> r = 5;
    auto chained = r.and_then([](int v) -> core::Result<std::string> {
        return std::to_string(v * 3);
    });
    CHECK(chained.ok());
    CHECK_EQ(chained.value(), "15");

    core::Result<int> err = core::Error(core::ErrorCode::VALIDATION_ERROR, "v");
    auto chained_err = err.and_then([](int v) -> core::Result<std::string> {
        return std::to_string(v);
    });
    CHECK(!chained_err.ok());
    CHECK_EQ(chained_err.error().code(), core::ErrorCode::VALIDATION_ERROR);
}

namespace {

core::Result<int> half(int v) {
    if (v % 2 != 0) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE, "odd");
    }
    return v / 2;
}

core::Result<int> quarter(int v) {
    PST_TRY_ASSIGN(h, half(v));
    return half(h);
}

core::Result<void> require_even(int v) {
    PST_TRY_VOID(half(v));
    return core::make_ok();
}

} // namespace

TEST_CASE(ErrorResult, try_macros_propagate) {
    CHECK_EQ(quarter(12).value(), 3);
    CHECK_ERR_CODE(quarter(6), core::ErrorCode::VALIDATION_RANGE);
    CHECK_OK(require_even(4));
    CHECK_ERR_CODE(require_even(5), core::ErrorCode::VALIDATION_RANGE);
}

// ============================================================================
// Stream
// ============================================================================

TEST_CASE(Stream, datastream_write_read) {
    core::DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.write(data);

    CHECK_EQ(ds.size(), 4u);
    CHECK_EQ(ds.remaining(), 4u);
    CHECK(!ds.eof());

    uint8_t buf[4];
    ds.read(std::span<uint8_t>(buf, 4));
    CHECK_EQ(buf[0], 0x01);
    CHECK_EQ(buf[3], 0x04);
    CHECK(ds.eof());
    CHECK_EQ(ds.remaining(), 0u);
}

TEST_CASE(Stream, datastream_read_past_end_throws) {
    core::DataStream ds(std::vector<uint8_t>{0xAA});
    uint8_t buf[2];
    CHECK_THROWS(ds.read(std::span<uint8_t>(buf, 2)));
}

TEST_CASE(Stream, datastream_release) {
    core::DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02};
    ds.write(data);
    auto released = ds.release();
    CHECK_EQ(released.size(), 2u);
    CHECK_EQ(ds.size(), 0u);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_CASE(Serialization, ser_u32_little_endian) {
    core::DataStream ds;
    core::ser_write_u32(ds, 0x12345678);

    CHECK_EQ(ds.size(), 4u);
    CHECK_EQ(ds.data()[0], 0x78);
    CHECK_EQ(ds.data()[3], 0x12);
    CHECK_EQ(core::ser_read_u32(ds), 0x12345678u);
}

TEST_CASE(Serialization, ser_i64_negative) {
    core::DataStream ds;
    core::ser_write_i64(ds, -42);
    core::ser_write_u64(ds, 0xDEADBEEFCAFEBABEULL);
    CHECK_EQ(ds.size(), 16u);
    CHECK_EQ(core::ser_read_i64(ds), -42);
    CHECK_EQ(core::ser_read_u64(ds), 0xDEADBEEFCAFEBABEULL);
}

TEST_CASE(Serialization, ser_compact_size) {
    core::DataStream ds1;
    core::ser_write_compact_size(ds1, 100);
    CHECK_EQ(ds1.size(), 1u);
    CHECK_EQ(core::ser_read_compact_size(ds1), 100u);

    core::DataStream ds2;
    core::ser_write_compact_size(ds2, 0xFFFF);
    CHECK_EQ(ds2.size(), 3u);
    CHECK_EQ(core::ser_read_compact_size(ds2), 0xFFFFu);

    core::DataStream ds3;
    core::ser_write_compact_size(ds3, 0x10000);
    CHECK_EQ(ds3.size(), 5u);
    CHECK_EQ(core::ser_read_compact_size(ds3), 0x10000u);
}

TEST_CASE(Serialization, ser_identifiers) {
    auto account = core::uint160::from_hex("00112233445566778899aabbccddeeff01234567");
    auto digest = core::uint256::from_hex(
        "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
    core::DataStream ds;
    core::ser_write_uint160(ds, account);
    core::ser_write_uint256(ds, digest);
    core::ser_write_string(ds, "hello");
    core::ser_write_bool(ds, true);

    CHECK(core::ser_read_uint160(ds) == account);
    CHECK(core::ser_read_uint256(ds) == digest);
    CHECK_EQ(core::ser_read_string(ds), "hello");
    CHECK(core::ser_read_bool(ds));
    CHECK(ds.eof());
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_forms) {
    const char* argv[] = {"pstd", "-rpcport=9000", "--datadir=/tmp/x",
                          "-printtoconsole", "-nosnapshot", "-norpc",
                          "positional", "-debug=ledger", "-debug=rpc"};
    core::Config cfg;
    cfg.parse_args(9, argv);

    CHECK_EQ(cfg.get_int("rpcport", 0), 9000);
    CHECK_EQ(cfg.get_or("datadir", ""), "/tmp/x");
    CHECK(cfg.get_bool("printtoconsole", false));
    CHECK(!cfg.get_bool("snapshot", true));
    CHECK(cfg.get_bool("norpc", false));
    CHECK(!cfg.has("positional"));

    auto cats = cfg.get_list("debug");
    CHECK_EQ(cats.size(), 2u);
    CHECK_EQ(cats[0], "ledger");
    CHECK_EQ(cats[1], "rpc");
    CHECK_EQ(cfg.data_dir(), std::filesystem::path("/tmp/x"));
}

TEST_CASE(Config, file_text_and_priority) {
    core::Config cfg;
    cfg.parse_text("# comment\n"
                   "rpcport = 7000\n"
                   "  treasury=0011\n"
                   "\n"
                   "snapshot\n"
                   "RPCUser=alice\n");
    CHECK_EQ(cfg.get_int("rpcport", 0), 7000);
    CHECK_EQ(cfg.get_or("treasury", ""), "0011");
    CHECK(cfg.get_bool("snapshot", false));
    CHECK_EQ(cfg.get_or("rpcuser", ""), "alice");

    // Command line overrides the file.
    const char* argv[] = {"pstd", "-rpcport=7100"};
    cfg.parse_args(2, argv);
    CHECK_EQ(cfg.get_int("rpcport", 0), 7100);
}

TEST_CASE(Config, typed_getters) {
    core::Config cfg;
    cfg.set("a", "12");
    cfg.set("b", "-3");
    cfg.set("c", "x1");
    cfg.set("d", "YES");
    CHECK_EQ(cfg.get_uint("a").value(), 12u);
    CHECK(!cfg.get_uint("b").has_value());
    CHECK(!cfg.get_uint("c").has_value());
    CHECK(!cfg.get_uint("missing").has_value());
    CHECK_EQ(cfg.get_int("b", 0), -3);
    CHECK_EQ(cfg.get_int("c", 77), 77);
    CHECK(cfg.get_bool("d", false));
    CHECK_EQ(cfg.get_or("missing", "dflt"), "dflt");
}

TEST_CASE(Config, parse_file_missing) {
    core::Config cfg;
    CHECK(!cfg.parse_file("/nonexistent/pst/pst.conf"));
}

// ============================================================================
// Filesystem
// ============================================================================

TEST_CASE(Fs, write_read_atomic) {
    TempDir dir;
    auto file = dir.path / "sub" / "data.bin";
    CHECK(core::fs::ensure_directory(dir.path / "sub"));
    CHECK(!core::fs::file_exists(file));
    CHECK(!core::fs::read_file(file).has_value());

    CHECK(core::fs::write_file(file, "first"));
    CHECK(core::fs::write_file(file, "second version"));
    CHECK(core::fs::file_exists(file));
    CHECK_EQ(core::fs::read_file(file).value(), "second version");
    CHECK_EQ(core::fs::file_size(file).value(), 14u);
}

TEST_CASE(Fs, rename_safe) {
    TempDir dir;
    auto a = dir.path / "a";
    auto b = dir.path / "b";
    CHECK(core::fs::write_file(a, "x"));
    CHECK(core::fs::rename_safe(a, b));
    CHECK(!core::fs::file_exists(a));
    CHECK(core::fs::file_exists(b));
}

TEST_CASE(Fs, file_lock_is_exclusive) {
    TempDir dir;
    auto lock_path = dir.path / ".lock";
    {
        core::fs::FileLock first(lock_path);
        CHECK(first.try_lock());

        core::fs::FileLock second(lock_path);
        CHECK(!second.try_lock());
    }
    core::fs::FileLock third(lock_path);
    CHECK(third.try_lock());
}

// ============================================================================
// Time
// ============================================================================

TEST_CASE(Time, manual_clock) {
    core::ManualClock clock(100);
    auto source = clock.source();
    CHECK_EQ(source(), 100);
    clock.advance(5);
    CHECK_EQ(source(), 105);
    clock.set(7);
    CHECK_EQ(clock.now(), 7);
}

TEST_CASE(Time, system_source_tracks_wall_clock) {
    auto source = core::system_time_source();
    int64_t before = core::get_time();
    int64_t now = source();
    CHECK(now >= before);
    CHECK(now - before < 5);
}

TEST_CASE(Time, iso8601) {
    CHECK_EQ(core::format_iso8601(1700000000), "2023-11-14T22:13:20Z");
    CHECK_EQ(core::parse_iso8601("2023-11-14T22:13:20Z").value(), 1700000000);
    CHECK(!core::parse_iso8601("2023-11-14").has_value());
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, parse_names) {
    core::LogLevel level = core::LogLevel::INFO;
    CHECK(core::parse_log_level("DEBUG", level));
    CHECK(level == core::LogLevel::DEBUG);
    CHECK(core::parse_log_level("off", level));
    CHECK(level == core::LogLevel::OFF);
    CHECK(!core::parse_log_level("loud", level));

    core::LogCategory cat = core::LogCategory::NONE;
    CHECK(core::parse_log_category("ledger", cat));
    CHECK(cat == core::LogCategory::LEDGER);
    CHECK(core::parse_log_category("RPC", cat));
    CHECK(cat == core::LogCategory::RPC);
    CHECK(core::parse_log_category("all", cat));
    CHECK(cat == core::LogCategory::ALL);
    CHECK(!core::parse_log_category("network", cat));

    CHECK_EQ(core::log_category_string(core::LogCategory::FEES), "FEES");
}

TEST_CASE(Logging, category_and_level_filter) {
    auto& logger = core::Logger::instance();
    auto saved_level = logger.level();
    auto saved_cats = logger.enabled_categories();

    logger.set_level(core::LogLevel::INFO);
    logger.set_categories(core::LogCategory::LEDGER | core::LogCategory::RPC);
    CHECK(logger.will_log(core::LogLevel::INFO, core::LogCategory::LEDGER));
    CHECK(!logger.will_log(core::LogLevel::DEBUG, core::LogCategory::LEDGER));
    CHECK(!logger.will_log(core::LogLevel::INFO, core::LogCategory::FEES));

    logger.enable_category(core::LogCategory::FEES);
    CHECK(logger.will_log(core::LogLevel::WARN, core::LogCategory::FEES));
    logger.disable_category(core::LogCategory::RPC);
    CHECK(!logger.will_log(core::LogLevel::ERR, core::LogCategory::RPC));

    logger.set_level(saved_level);
    logger.set_categories(saved_cats);
}

// ============================================================================
// WorkQueue
// ============================================================================

TEST_CASE(WorkQueue, bounded_push_pop) {
    core::WorkQueue<int> q(2);
    CHECK(q.try_push(1));
    CHECK(q.try_push(2));
    CHECK(!q.try_push(3));
    CHECK_EQ(q.size(), 2u);

    auto a = q.pop_for(std::chrono::milliseconds(10));
    CHECK(a.has_value());
    CHECK_EQ(*a, 1);
}

TEST_CASE(WorkQueue, close_drains_then_finishes) {
    core::WorkQueue<int> q;
    CHECK(q.try_push(7));
    q.close();
    CHECK(q.closed());
    CHECK(!q.try_push(8));
    CHECK(!q.finished());
    CHECK_EQ(q.pop_for(std::chrono::milliseconds(10)).value(), 7);
    CHECK(q.finished());
    CHECK(!q.pop_for(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE(WorkQueue, consumer_wakes_on_push) {
    core::WorkQueue<int> q;
    int got = 0;
    std::thread consumer([&] {
        auto item = q.pop_for(std::chrono::seconds(5));
        got = item.value_or(-1);
    });
    CHECK(q.try_push(42));
    consumer.join();
    CHECK_EQ(got, 42);
}

// ============================================================================
// Shutdown signalling
// ============================================================================

TEST_CASE(Signal, request_and_reset) {
    core::reset_shutdown();
    CHECK(!core::shutdown_requested());
    CHECK(!core::wait_for_shutdown_for(std::chrono::milliseconds(5)));

    std::thread requester([] { core::request_shutdown(); });
    CHECK(core::wait_for_shutdown_for(std::chrono::seconds(5)));
    requester.join();
    CHECK(core::shutdown_requested());

    core::reset_shutdown();
    CHECK(!core::shutdown_requested());
}

// ============================================================================
// Random
// ============================================================================

TEST_CASE(Random, bytes_differ) {
    auto a = core::get_random_bytes_vec(32);
    auto b = core::get_random_bytes_vec(32);
    CHECK_EQ(a.size(), 32u);
    CHECK(a != b);

    std::array<uint8_t, 16> buf{};
    CHECK(core::try_get_random_bytes(buf));
}
