// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/asset_mover.h"
#include "core/logging.h"

#include <string>

namespace escrow {

namespace {

std::string describe(const AccountId& account, const AssetId& asset, Amount amount) {
    return std::to_string(amount) + " of " +
           (is_native(asset) ? std::string("native") : asset.to_hex()) +
           " for " + account.to_hex();
}

}  // namespace

core::Result<void> InMemoryAssetMover::debit(const AccountId& account,
                                             const AssetId& asset,
                                             Amount amount) {
    if (amount <= 0) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "debit amount must be positive");
    }

    std::lock_guard lock(mutex_);
    auto it = book_.find(Key{account, asset});
    Amount have = it == book_.end() ? 0 : it->second;
    if (have < amount) {
        return core::make_error(core::ErrorCode::ESCROW_INSUFFICIENT,
                                "balance " + std::to_string(have) + " below " +
                                std::to_string(amount));
    }
    it->second -= amount;
    if (it->second == 0) book_.erase(it);

    LOG_DEBUG(core::LogCategory::ASSET, "debit " + describe(account, asset, amount));
    return core::make_ok();
}

core::Result<void> InMemoryAssetMover::credit(const AccountId& account,
                                              const AssetId& asset,
                                              Amount amount) {
    if (amount <= 0) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "credit amount must be positive");
    }

    std::lock_guard lock(mutex_);
    Amount& slot = book_[Key{account, asset}];
    if (slot > MAX_AMOUNT - amount) {
        if (slot == 0) book_.erase(Key{account, asset});
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "credit would overflow the balance");
    }
    slot += amount;

    LOG_DEBUG(core::LogCategory::ASSET, "credit " + describe(account, asset, amount));
    return core::make_ok();
}

core::Result<Amount> InMemoryAssetMover::deposit(const AccountId& account,
                                                 const AssetId& asset,
                                                 Amount amount) {
    if (amount <= 0) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "deposit amount must be positive");
    }

    std::lock_guard lock(mutex_);
    Amount& slot = book_[Key{account, asset}];
    if (slot > MAX_AMOUNT - amount) {
        if (slot == 0) book_.erase(Key{account, asset});
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "deposit would overflow the balance");
    }
    slot += amount;
    LOG_INFO(core::LogCategory::ASSET, "deposit " + describe(account, asset, amount));
    return slot;
}

Amount InMemoryAssetMover::balance_of(const AccountId& account,
                                      const AssetId& asset) const {
    std::lock_guard lock(mutex_);
    auto it = book_.find(Key{account, asset});
    return it == book_.end() ? 0 : it->second;
}

Amount InMemoryAssetMover::total_of(const AssetId& asset) const {
    std::lock_guard lock(mutex_);
    Amount total = 0;
    for (const auto& [key, amount] : book_) {
        if (key.second != asset) continue;
        if (amount > MAX_AMOUNT - total) return MAX_AMOUNT;
        total += amount;
    }
    return total;
}

std::vector<InMemoryAssetMover::Balance> InMemoryAssetMover::balances() const {
    std::lock_guard lock(mutex_);
    std::vector<Balance> out;
    out.reserve(book_.size());
    for (const auto& [key, amount] : book_) {
        out.push_back(Balance{key.first, key.second, amount});
    }
    return out;
}

void InMemoryAssetMover::restore(const std::vector<Balance>& entries) {
    std::lock_guard lock(mutex_);
    book_.clear();
    for (const auto& e : entries) {
        if (e.amount > 0) book_[Key{e.account, e.asset}] = e.amount;
    }
}

}  // namespace escrow
