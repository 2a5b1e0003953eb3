// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"
#include "core/random.h"
#include "core/time.h"
#include "escrow/asset_mover.h"
#include "escrow/ledger.h"
#include "escrow/ledger_store.h"
#include "node/context.h"
#include "node/node.h"

#include <filesystem>
#include <string>
#include <vector>

namespace {

constexpr int64_t START = 1700000000;

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() /
               ("pst_test_node_" + std::to_string(core::get_random_uint64()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

core::Config args(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "pstd");
    core::Config cfg;
    cfg.parse_args(static_cast<int>(argv.size()), argv.data());
    return cfg;
}

core::uint160 account(uint8_t n) {
    core::uint160 a;
    a.data()[19] = n;
    return a;
}

// A small ledger with one pending, one claimed and one canceled transfer.
struct LedgerFixture {
    core::ManualClock          clock{START};
    escrow::InMemoryAssetMover book;
    escrow::TransferLedger     ledger;

    LedgerFixture() : ledger(options(), book) {
        const auto& native = escrow::NATIVE_ASSET;
        (void)book.deposit(account(1), native, 100000);
        auto a = ledger.create(account(1), account(2), native, 1000, "open sesame", START + 3600);
        auto b = ledger.create(account(1), account(3), native, 2000, "open sesame", START + 3600);
        (void)ledger.create(account(1), account(2), native, 500, "open sesame", START + 3600);
        if (b.ok()) (void)ledger.cancel(b.value().id, account(1));
        clock.advance(escrow::DEFAULT_CANCEL_COOLDOWN + 1);
        if (a.ok()) (void)ledger.claim(a.value().id, account(2), "open sesame");
    }

    escrow::LedgerOptions options() {
        escrow::LedgerOptions o;
        o.treasury = account(99);
        o.password_iterations = 1000;
        o.clock    = clock.source();
        return o;
    }
};

} // namespace

// ===========================================================================
// Node :: configuration
// ===========================================================================

TEST_CASE(Node, ConfigDefaults) {
    node::NodeConfig cfg;

    CHECK(cfg.rpc_enabled);
    CHECK_EQ(cfg.rpc_port, uint16_t{9645});
    CHECK_EQ(cfg.rpc_bind, std::string("127.0.0.1"));
    CHECK(cfg.rpc_user.empty());
    CHECK_EQ(cfg.rpc_threads, 4);

    CHECK_EQ(cfg.fee_tiers.limit_one, static_cast<int64_t>(100));
    CHECK_EQ(cfg.fee_tiers.limit_two, static_cast<int64_t>(1000));
    CHECK_EQ(cfg.fee_scaling, uint64_t{10000});
    CHECK_EQ(cfg.cancel_cooldown, static_cast<int64_t>(1800));
    CHECK_EQ(cfg.availability, static_cast<int64_t>(604800));
    CHECK_EQ(cfg.min_password_length, size_t{7});
    CHECK_EQ(cfg.password_iterations, uint32_t{100000});
    CHECK(cfg.treasury.is_zero());
    CHECK(cfg.snapshot);

    CHECK_EQ(static_cast<int>(cfg.log_level), static_cast<int>(core::LogLevel::INFO));
    CHECK_EQ(cfg.log_file, std::string("debug.log"));
}

TEST_CASE(Node, DerivedPaths) {
    node::NodeConfig cfg;
    cfg.datadir = "/var/lib/pst";
    CHECK_EQ(cfg.snapshot_path(), std::filesystem::path("/var/lib/pst/ledger.dat"));
    CHECK_EQ(cfg.log_file_path(), std::filesystem::path("/var/lib/pst/debug.log"));

    cfg.log_file = "/tmp/pst.log";
    CHECK_EQ(cfg.log_file_path(), std::filesystem::path("/tmp/pst.log"));
}

TEST_CASE(Node, VersionString) {
    CHECK_EQ(node::get_version_string(), std::string("0.1.0-alpha"));
    CHECK(node::get_client_name().starts_with("PST Escrow v"));
}

TEST_CASE(Node, BuildConfigFromArgs) {
    auto raw = args({"-datadir=/tmp/pst-x", "-rpcport=19000", "-norpc",
                     "-feerateone=200", "-cancelcooldown=60", "-availability=3600",
                     "-passworditerations=2000",
                     "-treasury=00000000000000000000000000000000000000aa",
                     "-loglevel=debug", "-debug=ledger,rpc", "-snapshot=0"});
    auto built = node::build_node_config(raw);
    CHECK_OK(built);
    const auto& nc = built.value();

    CHECK_EQ(nc.datadir, std::filesystem::path("/tmp/pst-x"));
    CHECK_EQ(nc.rpc_port, uint16_t{19000});
    CHECK(!nc.rpc_enabled);
    CHECK_EQ(nc.fee_rates.rate_one, uint64_t{200});
    CHECK_EQ(nc.fee_rates.rate_two, uint64_t{50});
    CHECK_EQ(nc.cancel_cooldown, static_cast<int64_t>(60));
    CHECK_EQ(nc.availability, static_cast<int64_t>(3600));
    CHECK_EQ(nc.password_iterations, uint32_t{2000});
    CHECK_EQ(nc.treasury.to_hex(), std::string("00000000000000000000000000000000000000aa"));
    CHECK(!nc.snapshot);
    CHECK_EQ(static_cast<int>(nc.log_level), static_cast<int>(core::LogLevel::DEBUG));
    CHECK(nc.log_categories == (core::LogCategory::LEDGER | core::LogCategory::RPC));
}

TEST_CASE(Node, BuildConfigRejectsBadValues) {
    CHECK_ERR_CODE(node::build_node_config(args({"-rpcport=70000"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-rpcport=abc"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-rpcthreads=0"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-rpcuser=alice"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-availability=0"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-passworditerations=0"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-treasury=xyz"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-loglevel=loud"})),
                   core::ErrorCode::VALIDATION_ERROR);
    CHECK_ERR_CODE(node::build_node_config(args({"-debug=network"})),
                   core::ErrorCode::VALIDATION_ERROR);
}

TEST_CASE(Node, BuildConfigRejectsBadFeeSchedule) {
    CHECK_ERR_CODE(node::build_node_config(args({"-feescaling=0"})),
                   core::ErrorCode::ESCROW_BAD_FEE_CONFIG);
    CHECK_ERR_CODE(node::build_node_config(args({"-feelimitone=5000"})),
                   core::ErrorCode::ESCROW_BAD_FEE_CONFIG);
}

TEST_CASE(Node, DebugNoneClearsCategories) {
    auto built = node::build_node_config(args({"-debug=ledger", "-debug=none"}));
    CHECK_OK(built);
    CHECK(built.value().log_categories == core::LogCategory::NONE);
}

TEST_CASE(Node, LoadConfigFile) {
    TempDir dir;
    CHECK(core::fs::write_file(dir.path / "pst.conf",
                               "# escrow daemon\nrpcport=19100\ncancelcooldown=120\n"));

    std::string datadir = "-datadir=" + dir.path.string();
    auto raw = args({datadir.c_str(), "-rpcport=19200"});
    CHECK_OK(node::load_config_file(raw));

    auto built = node::build_node_config(raw);
    CHECK_OK(built);
    // The command line wins over the file.
    CHECK_EQ(built.value().rpc_port, uint16_t{19200});
    CHECK_EQ(built.value().cancel_cooldown, static_cast<int64_t>(120));
}

TEST_CASE(Node, LoadConfigFileMissing) {
    TempDir dir;
    std::string datadir = "-datadir=" + dir.path.string();

    // A missing default file is fine.
    auto plain = args({datadir.c_str()});
    CHECK_OK(node::load_config_file(plain));

    // A missing file named explicitly is not.
    auto named = args({datadir.c_str(), "-conf=other.conf"});
    CHECK_ERR_CODE(node::load_config_file(named), core::ErrorCode::STORAGE_NOT_FOUND);
}

// ===========================================================================
// LedgerStore
// ===========================================================================

TEST_CASE(LedgerStore, SaveAndLoad) {
    TempDir dir;
    LedgerFixture src;
    escrow::LedgerStore store(dir.path / "ledger.dat");
    CHECK(!store.exists());
    CHECK_OK(store.save(src.ledger, &src.book));
    CHECK(store.exists());

    core::ManualClock clock{START};
    escrow::InMemoryAssetMover book;
    escrow::LedgerOptions options;
    options.treasury = account(99);
    options.password_iterations = 1000;
    options.clock    = clock.source();
    escrow::TransferLedger restored(options, book);
    CHECK_OK(store.load(restored, &book));

    CHECK_EQ(restored.size(), size_t{3});
    CHECK_EQ(restored.next_id(), src.ledger.next_id());
    CHECK_EQ(restored.list_pending().size(), size_t{1});
    CHECK_EQ(restored.count_history_for(account(1)), size_t{2});
    const auto& native = escrow::NATIVE_ASSET;
    CHECK_EQ(restored.collected_fees(native), src.ledger.collected_fees(native));
    CHECK_EQ(book.balance_of(account(2), native), static_cast<int64_t>(1000));
    CHECK_EQ(book.balance_of(account(1), native), src.book.balance_of(account(1), native));

    // Restored passwords still gate the pending transfer.
    auto pending = restored.list_pending();
    CHECK_ERR_CODE(restored.claim(pending[0].id, account(2), "wrong password"),
                   core::ErrorCode::ESCROW_CLAIM_NOT_OPEN);
    clock.advance(escrow::DEFAULT_CANCEL_COOLDOWN + 1);
    CHECK_ERR_CODE(restored.claim(pending[0].id, account(2), "wrong password"),
                   core::ErrorCode::ESCROW_BAD_PASSWORD);
    CHECK_OK(restored.claim(pending[0].id, account(2), "open sesame"));
}

TEST_CASE(LedgerStore, MissingFile) {
    TempDir dir;
    escrow::LedgerStore store(dir.path / "absent.dat");
    CHECK_ERR_CODE(store.read(), core::ErrorCode::STORAGE_NOT_FOUND);
}

TEST_CASE(LedgerStore, CorruptionDetected) {
    LedgerFixture src;
    escrow::Snapshot snapshot;
    snapshot.next_id  = src.ledger.next_id();
    snapshot.records  = src.ledger.export_records();
    snapshot.balances = src.book.balances();

    auto bytes = escrow::LedgerStore::encode(snapshot);
    CHECK_OK(escrow::LedgerStore::decode(bytes));

    auto flipped = bytes;
    flipped[10] ^= 0x40;
    CHECK_ERR_CODE(escrow::LedgerStore::decode(flipped), core::ErrorCode::STORAGE_CORRUPT);

    auto truncated = std::vector<uint8_t>(bytes.begin(), bytes.begin() + 20);
    CHECK_ERR_CODE(escrow::LedgerStore::decode(truncated), core::ErrorCode::STORAGE_CORRUPT);

    CHECK_ERR_CODE(escrow::LedgerStore::decode(std::vector<uint8_t>{}),
                   core::ErrorCode::STORAGE_CORRUPT);
}

TEST_CASE(LedgerStore, DecodePreservesRecords) {
    LedgerFixture src;
    escrow::Snapshot snapshot;
    snapshot.next_id  = src.ledger.next_id();
    snapshot.records  = src.ledger.export_records();
    snapshot.balances = src.book.balances();

    auto decoded = escrow::LedgerStore::decode(escrow::LedgerStore::encode(snapshot));
    CHECK_OK(decoded);
    const auto& out = decoded.value();
    CHECK_EQ(out.next_id, snapshot.next_id);
    CHECK_EQ(out.records.size(), snapshot.records.size());
    CHECK_EQ(out.balances.size(), snapshot.balances.size());
    for (size_t i = 0; i < out.records.size(); ++i) {
        CHECK_EQ(out.records[i].id, snapshot.records[i].id);
        CHECK(out.records[i].status == snapshot.records[i].status);
        CHECK_EQ(out.records[i].net_amount, snapshot.records[i].net_amount);
    }
}

TEST_CASE(LedgerStore, LoadRefusesNonEmptyLedger) {
    TempDir dir;
    LedgerFixture src;
    escrow::LedgerStore store(dir.path / "ledger.dat");
    CHECK_OK(store.save(src.ledger, &src.book));

    LedgerFixture other;
    auto balance_before = other.book.balance_of(account(1), escrow::NATIVE_ASSET);
    CHECK_ERR(store.load(other.ledger, &other.book));
    // Neither the ledger nor the book is touched.
    CHECK_EQ(other.ledger.size(), size_t{3});
    CHECK_EQ(other.book.balance_of(account(1), escrow::NATIVE_ASSET), balance_before);
}

// ===========================================================================
// Node lifecycle
// ===========================================================================

TEST_CASE(Node, InitPersistsAcrossRestart) {
    TempDir dir;
    node::NodeConfig cfg;
    cfg.datadir          = dir.path;
    cfg.rpc_enabled      = false;
    cfg.log_level        = core::LogLevel::OFF;
    cfg.log_file         = "";
    cfg.print_to_console = false;
    cfg.password_iterations = 1500;

    {
        node::Node n(cfg);
        CHECK_OK(n.init());
        CHECK(n.is_running());
        CHECK(n.ledger() != nullptr);
        CHECK(n.rpc_server() == nullptr);

        // A second node cannot share the data directory.
        node::Node rival(cfg);
        CHECK_ERR_CODE(rival.init(), core::ErrorCode::STORAGE_ERROR);

        CHECK_OK(n.book()->deposit(account(1), escrow::NATIVE_ASSET, 10000));
        auto created = n.ledger()->create(account(1), account(2), escrow::NATIVE_ASSET,
                                          1000, "open sesame",
                                          core::get_time() + 3600);
        CHECK_OK(created);
        n.shutdown();
        CHECK(!n.is_running());
        CHECK(n.ledger() == nullptr);
    }

    CHECK(core::fs::file_exists(cfg.snapshot_path()));

    node::Node again(cfg);
    CHECK_OK(again.init());
    CHECK_EQ(again.ledger()->size(), size_t{1});
    // The work factor travels with the stored commitment.
    auto records = again.ledger()->export_records();
    CHECK_EQ(records[0].password_hash.iterations, uint32_t{1500});
    CHECK_EQ(again.book()->balance_of(account(1), escrow::NATIVE_ASSET), static_cast<int64_t>(10000 - 1005));
    again.shutdown();

    core::Logger::instance().set_level(core::LogLevel::OFF);
}

TEST_CASE(Node, InitRejectsCorruptSnapshot) {
    TempDir dir;
    node::NodeConfig cfg;
    cfg.datadir          = dir.path;
    cfg.rpc_enabled      = false;
    cfg.log_level        = core::LogLevel::OFF;
    cfg.log_file         = "";
    cfg.print_to_console = false;

    CHECK(core::fs::write_file(cfg.snapshot_path(), "PSTL not really a snapshot"));

    node::Node n(cfg);
    CHECK_ERR_CODE(n.init(), core::ErrorCode::STORAGE_CORRUPT);
    CHECK(!n.is_running());
    // The unreadable file is left for the operator.
    CHECK(core::fs::file_exists(cfg.snapshot_path()));

    core::Logger::instance().set_level(core::LogLevel::OFF);
}
