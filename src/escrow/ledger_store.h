#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/fs.h"
#include "escrow/asset_mover.h"
#include "escrow/ledger.h"
#include "escrow/transfer.h"

#include <cstdint>
#include <span>
#include <vector>

namespace escrow {

inline constexpr uint32_t SNAPSHOT_VERSION = 2;

/// Everything a snapshot file carries.
struct Snapshot {
    TransferId                               next_id = 1;
    std::vector<Transfer>                    records;
    std::vector<InMemoryAssetMover::Balance> balances;
};

// ---------------------------------------------------------------------------
// LedgerStore -- ledger snapshot file
// ---------------------------------------------------------------------------
// Layout:
//   "PSTL" | u32 version | u64 next id | compact-size n | n x Transfer
//        | compact-size m | m x (account, asset, i64 amount)
//        | SHA3-256 of all preceding bytes
//
// Files are replaced atomically. Snapshots are taken while no transitions
// run (at shutdown), so records and balances are mutually consistent.
// ---------------------------------------------------------------------------
class LedgerStore {
public:
    explicit LedgerStore(core::fs::path file) : file_(std::move(file)) {}

    [[nodiscard]] const core::fs::path& file() const noexcept { return file_; }
    [[nodiscard]] bool exists() const { return core::fs::file_exists(file_); }

    /// @p book may be null when the ledger runs against another mover.
    [[nodiscard]] core::Result<void> save(const TransferLedger& ledger,
                                          const InMemoryAssetMover* book) const;

    /// STORAGE_NOT_FOUND when the file is missing, STORAGE_CORRUPT when it
    /// does not decode. Neither target is touched on failure.
    [[nodiscard]] core::Result<Snapshot> read() const;

    /// read() followed by import into an empty @p ledger and, when given,
    /// restoring @p book.
    [[nodiscard]] core::Result<void> load(TransferLedger& ledger,
                                          InMemoryAssetMover* book) const;

    [[nodiscard]] static std::vector<uint8_t> encode(const Snapshot& snapshot);
    [[nodiscard]] static core::Result<Snapshot> decode(std::span<const uint8_t> bytes);

private:
    core::fs::path file_;
};

}  // namespace escrow
