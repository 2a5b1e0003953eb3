// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/ledger_store.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "crypto/commitment.h"
#include "crypto/sha3.h"

#include <array>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>

namespace escrow {

namespace {

constexpr std::array<uint8_t, 4> MAGIC = {'P', 'S', 'T', 'L'};
constexpr size_t CHECKSUM_SIZE = 32;

}  // namespace

std::vector<uint8_t> LedgerStore::encode(const Snapshot& snapshot) {
    core::DataStream s;
    s.write(MAGIC);
    core::ser_write_u32(s, SNAPSHOT_VERSION);
    core::ser_write_u64(s, snapshot.next_id);

    core::ser_write_obj_vector(s, snapshot.records);

    core::ser_write_compact_size(s, snapshot.balances.size());
    for (const auto& b : snapshot.balances) {
        core::ser_write_uint160(s, b.account);
        core::ser_write_uint160(s, b.asset);
        core::ser_write_i64(s, b.amount);
    }

    std::vector<uint8_t> out(s.data(), s.data() + s.size());
    core::uint256 checksum = crypto::sha3_256(out);
    out.insert(out.end(), checksum.bytes().begin(), checksum.bytes().end());
    return out;
}

core::Result<Snapshot> LedgerStore::decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < MAGIC.size() + CHECKSUM_SIZE) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "snapshot truncated");
    }

    auto body = bytes.first(bytes.size() - CHECKSUM_SIZE);
    core::uint256 stored = core::uint256::from_bytes(
        bytes.last<CHECKSUM_SIZE>());
    core::uint256 actual;
    try {
        actual = crypto::sha3_256(body);
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::CRYPTO_HASH_FAIL, e.what());
    }
    if (!crypto::constant_time_equal(stored, actual)) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "snapshot checksum mismatch");
    }

    Snapshot snapshot;
    try {
        core::DataStream s(body);

        std::array<uint8_t, 4> magic{};
        s.read(magic);
        if (magic != MAGIC) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "not a ledger snapshot");
        }
        uint32_t version = core::ser_read_u32(s);
        if (version != SNAPSHOT_VERSION) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "unsupported snapshot version " +
                                    std::to_string(version));
        }
        snapshot.next_id = core::ser_read_u64(s);

        snapshot.records = core::ser_read_obj_vector<core::DataStream, Transfer>(s);

        uint64_t m = core::ser_read_compact_size(s);
        if (m > core::MAX_VECTOR_SIZE) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "balance count out of range");
        }
        snapshot.balances.reserve(m);
        for (uint64_t i = 0; i < m; ++i) {
            InMemoryAssetMover::Balance b;
            b.account = core::ser_read_uint160(s);
            b.asset   = core::ser_read_uint160(s);
            b.amount  = core::ser_read_i64(s);
            if (b.amount < 0) {
                return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                        "negative balance");
            }
            snapshot.balances.push_back(b);
        }

        if (!s.eof()) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "trailing bytes after snapshot");
        }
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT, e.what());
    }
    return snapshot;
}

core::Result<void> LedgerStore::save(const TransferLedger& ledger,
                                     const InMemoryAssetMover* book) const {
    Snapshot snapshot;
    snapshot.next_id = ledger.next_id();
    snapshot.records = ledger.export_records();
    if (book != nullptr) snapshot.balances = book->balances();

    std::vector<uint8_t> bytes;
    try {
        bytes = encode(snapshot);
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::CRYPTO_HASH_FAIL, e.what());
    }

    std::string_view content(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
    if (!core::fs::write_file(file_, content)) {
        LOG_ERROR(core::LogCategory::STORAGE,
                  "failed to write snapshot " + file_.string());
        return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                "cannot write " + file_.string());
    }

    LOG_INFO(core::LogCategory::STORAGE,
             "wrote " + std::to_string(snapshot.records.size()) +
             " transfers to " + file_.string());
    return core::make_ok();
}

core::Result<Snapshot> LedgerStore::read() const {
    auto content = core::fs::read_file(file_);
    if (!content) {
        return core::make_error(core::ErrorCode::STORAGE_NOT_FOUND,
                                "cannot read " + file_.string());
    }
    auto bytes = std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(content->data()), content->size());
    return decode(bytes);
}

core::Result<void> LedgerStore::load(TransferLedger& ledger,
                                     InMemoryAssetMover* book) const {
    PST_TRY_ASSIGN(snapshot, read());
    PST_TRY_VOID(ledger.import_records(std::move(snapshot.records),
                                       snapshot.next_id));
    if (book != nullptr) book->restore(snapshot.balances);

    LOG_INFO(core::LogCategory::STORAGE,
             "loaded snapshot " + file_.string() + " with " +
             std::to_string(snapshot.balances.size()) + " balances");
    return core::make_ok();
}

}  // namespace escrow
