#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "escrow/types.h"

#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace escrow {

// ---------------------------------------------------------------------------
// AssetMover -- moves balances on behalf of the ledger
// ---------------------------------------------------------------------------
// Each call either moves the full amount or fails without moving anything,
// and reports the outcome synchronously. The ledger never retries.
// ---------------------------------------------------------------------------
class AssetMover {
public:
    virtual ~AssetMover() = default;

    [[nodiscard]] virtual core::Result<void> debit(const AccountId& account,
                                                   const AssetId& asset,
                                                   Amount amount) = 0;

    [[nodiscard]] virtual core::Result<void> credit(const AccountId& account,
                                                    const AssetId& asset,
                                                    Amount amount) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryAssetMover -- a balance book keyed by (account, asset)
// ---------------------------------------------------------------------------
// Backs the daemon and the tests.
// ---------------------------------------------------------------------------
class InMemoryAssetMover : public AssetMover {
public:
    struct Balance {
        AccountId account;
        AssetId   asset;
        Amount    amount = 0;
    };

    /// ESCROW_INSUFFICIENT when the balance is short, ESCROW_AMOUNT_RANGE
    /// for a non-positive amount.
    [[nodiscard]] core::Result<void> debit(const AccountId& account,
                                           const AssetId& asset,
                                           Amount amount) override;

    /// ESCROW_AMOUNT_RANGE when the balance would overflow.
    [[nodiscard]] core::Result<void> credit(const AccountId& account,
                                            const AssetId& asset,
                                            Amount amount) override;

    /// Mints funds into an account. Returns the new balance.
    [[nodiscard]] core::Result<Amount> deposit(const AccountId& account,
                                               const AssetId& asset,
                                               Amount amount);

    [[nodiscard]] Amount balance_of(const AccountId& account,
                                    const AssetId& asset) const;

    /// Sum of all balances of one asset, saturating at MAX_AMOUNT.
    [[nodiscard]] Amount total_of(const AssetId& asset) const;

    /// Non-zero balances, ordered by (account, asset).
    [[nodiscard]] std::vector<Balance> balances() const;

    /// Replaces the whole book.
    void restore(const std::vector<Balance>& entries);

private:
    using Key = std::pair<AccountId, AssetId>;

    // Leaf lock: nothing else is acquired while it is held.
    mutable std::mutex mutex_;
    std::map<Key, Amount> book_;
};

}  // namespace escrow
