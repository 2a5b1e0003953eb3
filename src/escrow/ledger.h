#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/sync.h"
#include "core/time.h"
#include "crypto/commitment.h"
#include "escrow/asset_mover.h"
#include "escrow/cooldown.h"
#include "escrow/fee_schedule.h"
#include "escrow/transfer.h"
#include "escrow/types.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace escrow {

inline constexpr size_t DEFAULT_MIN_PASSWORD_LENGTH = 7;

/// Construction-time configuration of a TransferLedger. Nothing here can
/// change after construction.
struct LedgerOptions {
    FeeSchedule      fees = FeeSchedule::defaults();
    int64_t          cancel_cooldown = DEFAULT_CANCEL_COOLDOWN;
    size_t           min_password_length = DEFAULT_MIN_PASSWORD_LENGTH;
    AccountId        treasury;   // receives fees, never sends; zero account by default
    uint32_t         password_iterations = crypto::PBKDF2_ITERATIONS;
    core::TimeSource clock = core::system_time_source();
};

/// What create() charged.
struct CreateReceipt {
    TransferId id = 0;
    Amount     fee = 0;
    Amount     total = 0;
    int64_t    creation_time = 0;
};

// ---------------------------------------------------------------------------
// TransferLedger -- password-gated escrow of asset transfers
// ---------------------------------------------------------------------------
// A sender locks amount + fee; the receiver releases the amount with the
// password after the cancel cooldown, the sender may cancel during the
// cooldown, and anyone may return an expired transfer to its sender.
//
// Locking: arena_ guards the record map and the account index. Creates
// take it exclusively; transitions take it shared and then lock the
// single record's slot, so distinct transfers settle in parallel while
// two transitions on one transfer serialize. Asset movements happen under
// the slot lock and the record's status only changes once the movement
// has succeeded.
// ---------------------------------------------------------------------------
class TransferLedger {
public:
    /// @p commitment defaults to a Sha3PasswordCommitment with
    /// options.password_iterations. @p mover must outlive the ledger.
    TransferLedger(LedgerOptions options, AssetMover& mover,
                   std::unique_ptr<crypto::PasswordCommitment> commitment = nullptr);

    TransferLedger(const TransferLedger&) = delete;
    TransferLedger& operator=(const TransferLedger&) = delete;

    // -- Transitions -------------------------------------------------------

    [[nodiscard]] core::Result<CreateReceipt> create(
        const AccountId& sender, const AccountId& receiver,
        const AssetId& asset, Amount amount,
        std::string_view password, int64_t expiration_time);

    [[nodiscard]] core::Result<TransferView> cancel(TransferId id,
                                                    const AccountId& caller);

    [[nodiscard]] core::Result<TransferView> claim(TransferId id,
                                                   const AccountId& caller,
                                                   std::string_view password);

    /// Permissionless: any caller may return an expired transfer.
    [[nodiscard]] core::Result<TransferView> reclaim_expired(
        TransferId id, const AccountId& caller);

    // -- Queries -------------------------------------------------------------

    [[nodiscard]] core::Result<TransferView> get_transfer(TransferId id) const;

    /// Pending transfers the account sends or receives, ascending id.
    [[nodiscard]] std::vector<TransferView> list_pending_for(
        const AccountId& account) const;

    /// Terminal transfers the account sends or receives, ascending id.
    [[nodiscard]] std::vector<TransferView> list_history_for(
        const AccountId& account) const;

    /// All of the account's transfers, ascending id. limit == 0 means
    /// no limit.
    [[nodiscard]] std::vector<TransferView> list_transfers_for(
        const AccountId& account, size_t offset, size_t limit) const;

    [[nodiscard]] size_t count_history_for(const AccountId& account) const;

    [[nodiscard]] std::vector<TransferView> list_by_status_for(
        const AccountId& account, TransferStatus status) const;

    /// Every pending transfer in the ledger.
    [[nodiscard]] std::vector<TransferView> list_pending() const;

    // -- Configuration views -------------------------------------------------

    [[nodiscard]] const FeeSchedule& fee_schedule() const noexcept { return fees_; }
    [[nodiscard]] const CooldownPolicy& cooldown() const noexcept { return cooldown_; }
    [[nodiscard]] int64_t cooldown_period() const noexcept { return cooldown_.period(); }
    [[nodiscard]] size_t min_password_length() const noexcept { return min_password_length_; }
    [[nodiscard]] const AccountId& treasury() const noexcept { return treasury_; }

    [[nodiscard]] Amount collected_fees(const AssetId& asset) const;
    [[nodiscard]] std::map<AssetId, Amount> collected_fees() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] TransferId next_id() const;
    [[nodiscard]] int64_t now() const { return clock_(); }

    // -- Persistence ---------------------------------------------------------

    /// Full records, password commitments included, ascending id.
    [[nodiscard]] std::vector<Transfer> export_records() const;

    /// Loads records into an empty ledger and rebuilds the indexes and fee
    /// totals. Fails with STORAGE_CORRUPT on duplicate or out-of-range ids.
    [[nodiscard]] core::Result<void> import_records(std::vector<Transfer> records,
                                                    TransferId next_id);

private:
    struct Slot {
        core::Mutex mutex{"transfer"};
        Transfer    record;
    };

    [[nodiscard]] core::Result<void> check_password(std::string_view password) const;

    /// Caller holds arena_ (shared or exclusive).
    [[nodiscard]] Slot* find_slot(TransferId id) const;

    /// Credits net_amount to @p payee and, only on success, moves the
    /// record to @p final_status. Caller holds the slot lock.
    [[nodiscard]] core::Result<void> release(Transfer& record,
                                             const AccountId& payee,
                                             TransferStatus final_status);

    /// Collects views of the account's records matching @p pred.
    template <typename Pred>
    [[nodiscard]] std::vector<TransferView> collect_for(const AccountId& account,
                                                        Pred pred) const;

    FeeSchedule      fees_;
    CooldownPolicy   cooldown_;
    size_t           min_password_length_;
    AccountId        treasury_;
    core::TimeSource clock_;

    AssetMover& mover_;
    std::unique_ptr<crypto::PasswordCommitment> commitment_;

    mutable core::SharedMutex arena_{"ledger"};
    std::map<TransferId, std::unique_ptr<Slot>> slots_;
    std::unordered_map<AccountId, std::vector<TransferId>> by_account_;
    std::map<AssetId, Amount> collected_fees_;
    TransferId next_id_ = 1;
};

}  // namespace escrow
