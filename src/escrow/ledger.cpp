// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/ledger.h"
#include "core/logging.h"

#include <string>
#include <utility>

namespace escrow {

namespace {

core::Error movement_failed(std::string_view what, const core::Error& cause) {
    return core::make_error(
        core::ErrorCode::ESCROW_ASSET_MOVE_FAIL,
        std::string(what) + " failed: " +
        std::string(core::error_code_name(cause.code())) +
        (cause.message().empty() ? std::string() : " (" + cause.message() + ")"));
}

std::string tag(TransferId id) {
    return "transfer #" + std::to_string(id);
}

}  // namespace

TransferLedger::TransferLedger(LedgerOptions options, AssetMover& mover,
                               std::unique_ptr<crypto::PasswordCommitment> commitment)
    : fees_(std::move(options.fees))
    , cooldown_(options.cancel_cooldown)
    , min_password_length_(options.min_password_length)
    , treasury_(options.treasury)
    , clock_(options.clock ? std::move(options.clock) : core::system_time_source())
    , mover_(mover)
    , commitment_(commitment ? std::move(commitment)
                             : std::make_unique<crypto::Sha3PasswordCommitment>(
                                   options.password_iterations))
{
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

core::Result<void> TransferLedger::check_password(std::string_view password) const {
    if (password.empty()) {
        return core::make_error(core::ErrorCode::ESCROW_PASSWORD_MISSING,
                                "password must not be empty");
    }
    if (password.size() < min_password_length_) {
        return core::make_error(core::ErrorCode::ESCROW_PASSWORD_SHORT,
                                "password must be at least " +
                                std::to_string(min_password_length_) + " characters");
    }
    return core::make_ok();
}

TransferLedger::Slot* TransferLedger::find_slot(TransferId id) const {
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second.get();
}

core::Result<void> TransferLedger::release(Transfer& record,
                                           const AccountId& payee,
                                           TransferStatus final_status) {
    auto moved = mover_.credit(payee, record.asset, record.net_amount);
    if (!moved.ok()) {
        LOG_WARN(core::LogCategory::LEDGER,
                 tag(record.id) + ": credit to " + payee.to_hex() +
                 " failed, still pending: " + moved.error().format());
        return movement_failed("credit", moved.error());
    }
    record.status = final_status;
    LOG_INFO(core::LogCategory::LEDGER,
             tag(record.id) + " " + std::string(status_name(final_status)) +
             ", " + std::to_string(record.net_amount) + " to " + payee.to_hex());
    return core::make_ok();
}

template <typename Pred>
std::vector<TransferView> TransferLedger::collect_for(const AccountId& account,
                                                      Pred pred) const {
    std::vector<TransferView> out;
    int64_t now = clock_();

    READ_LOCK(arena_);
    auto it = by_account_.find(account);
    if (it == by_account_.end()) return out;

    for (TransferId id : it->second) {
        Slot* slot = find_slot(id);
        if (slot == nullptr) continue;
        LOCK(slot->mutex);
        if (pred(slot->record)) {
            out.push_back(TransferView::of(slot->record, cooldown_, now));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// create
// ---------------------------------------------------------------------------

core::Result<CreateReceipt> TransferLedger::create(
    const AccountId& sender, const AccountId& receiver, const AssetId& asset,
    Amount amount, std::string_view password, int64_t expiration_time) {

    if (sender == receiver) {
        return core::make_error(core::ErrorCode::ESCROW_SELF_TRANSFER,
                                "sender and receiver must differ");
    }
    if (sender == treasury_) {
        return core::make_error(core::ErrorCode::ESCROW_RESERVED_SENDER,
                                "the fee treasury cannot send transfers");
    }
    if (amount <= 0) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_TOO_LOW,
                                "amount must be greater than zero");
    }
    PST_TRY_VOID(check_password(password));

    int64_t now = clock_();
    if (expiration_time <= now) {
        return core::make_error(core::ErrorCode::ESCROW_BAD_EXPIRATION,
                                "expiration " + std::to_string(expiration_time) +
                                " is not after now " + std::to_string(now));
    }

    PST_TRY_ASSIGN(quote, fees_.quote(amount));
    PST_TRY_ASSIGN(hash, commitment_->commit(password));

    LOCK(arena_);

    auto debited = mover_.debit(sender, asset, quote.total);
    if (!debited.ok()) {
        LOG_INFO(core::LogCategory::LEDGER,
                 "create rejected: debit of " + std::to_string(quote.total) +
                 " from " + sender.to_hex() + " failed: " +
                 std::string(core::error_code_name(debited.error().code())));
        return movement_failed("debit", debited.error());
    }

    if (quote.fee > 0) {
        auto paid = mover_.credit(treasury_, asset, quote.fee);
        if (!paid.ok()) {
            auto refunded = mover_.credit(sender, asset, quote.total);
            if (!refunded.ok()) {
                LOG_ERROR(core::LogCategory::LEDGER,
                          "compensating credit of " + std::to_string(quote.total) +
                          " to " + sender.to_hex() + " failed: " +
                          refunded.error().format());
            }
            return movement_failed("fee credit", paid.error());
        }
    }

    TransferId id = next_id_++;
    auto slot = std::make_unique<Slot>();
    Transfer& t       = slot->record;
    t.id              = id;
    t.sender          = sender;
    t.receiver        = receiver;
    t.asset           = asset;
    t.net_amount      = amount;
    t.fee_amount      = quote.fee;
    t.password_hash   = hash;
    t.creation_time   = now;
    t.expiration_time = expiration_time;
    t.status          = TransferStatus::PENDING;

    slots_.emplace(id, std::move(slot));
    by_account_[sender].push_back(id);
    by_account_[receiver].push_back(id);
    if (quote.fee > 0) collected_fees_[asset] += quote.fee;

    LOG_INFO(core::LogCategory::LEDGER,
             tag(id) + " created: " + sender.to_hex() + " -> " + receiver.to_hex() +
             " amount " + std::to_string(amount) + " fee " + std::to_string(quote.fee) +
             " expires " + std::to_string(expiration_time));

    return CreateReceipt{id, quote.fee, quote.total, now};
}

// ---------------------------------------------------------------------------
// cancel
// ---------------------------------------------------------------------------

core::Result<TransferView> TransferLedger::cancel(TransferId id,
                                                  const AccountId& caller) {
    READ_LOCK(arena_);
    Slot* slot = find_slot(id);
    if (slot == nullptr) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_FOUND, tag(id));
    }

    LOCK(slot->mutex);
    Transfer& t = slot->record;
    int64_t now = clock_();

    if (t.sender != caller) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_SENDER,
                                "only the sender can cancel " + tag(id));
    }
    if (t.status != TransferStatus::PENDING) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_PENDING,
                                tag(id) + " is " + std::string(status_name(t.status)));
    }
    if (!cooldown_.cancel_window_open(t.creation_time, now)) {
        return core::make_error(core::ErrorCode::ESCROW_COOLDOWN_ELAPSED,
                                "cancel window closed at " +
                                std::to_string(cooldown_.cancel_deadline(t.creation_time)));
    }

    PST_TRY_VOID(release(t, t.sender, TransferStatus::CANCELED));
    return TransferView::of(t, cooldown_, now);
}

// ---------------------------------------------------------------------------
// claim
// ---------------------------------------------------------------------------

core::Result<TransferView> TransferLedger::claim(TransferId id,
                                                 const AccountId& caller,
                                                 std::string_view password) {
    READ_LOCK(arena_);
    Slot* slot = find_slot(id);
    if (slot == nullptr) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_FOUND, tag(id));
    }

    LOCK(slot->mutex);
    Transfer& t = slot->record;
    int64_t now = clock_();

    if (t.receiver != caller) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_RECEIVER,
                                "only the receiver can claim " + tag(id));
    }
    if (t.status != TransferStatus::PENDING) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_PENDING,
                                tag(id) + " is " + std::string(status_name(t.status)));
    }
    if (now <= cooldown_.cancel_deadline(t.creation_time)) {
        return core::make_error(core::ErrorCode::ESCROW_CLAIM_NOT_OPEN,
                                "claim opens at " +
                                std::to_string(cooldown_.claim_opens_at(t.creation_time)));
    }
    if (CooldownPolicy::is_expired(now, t.expiration_time)) {
        return core::make_error(core::ErrorCode::ESCROW_EXPIRED,
                                tag(id) + " expired at " +
                                std::to_string(t.expiration_time));
    }
    PST_TRY_VOID(check_password(password));

    PST_TRY_ASSIGN(matches, commitment_->verify(password, t.password_hash));
    if (!matches) {
        LOG_DEBUG(core::LogCategory::LEDGER,
                  tag(id) + ": incorrect password from " + caller.to_hex());
        return core::make_error(core::ErrorCode::ESCROW_BAD_PASSWORD,
                                "incorrect password");
    }

    PST_TRY_VOID(release(t, t.receiver, TransferStatus::CLAIMED));
    return TransferView::of(t, cooldown_, now);
}

// ---------------------------------------------------------------------------
// reclaim_expired
// ---------------------------------------------------------------------------

core::Result<TransferView> TransferLedger::reclaim_expired(TransferId id,
                                                           const AccountId& caller) {
    READ_LOCK(arena_);
    Slot* slot = find_slot(id);
    if (slot == nullptr) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_FOUND, tag(id));
    }

    LOCK(slot->mutex);
    Transfer& t = slot->record;
    int64_t now = clock_();

    if (t.status != TransferStatus::PENDING) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_PENDING,
                                tag(id) + " is " + std::string(status_name(t.status)));
    }
    if (!CooldownPolicy::is_expired(now, t.expiration_time)) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_EXPIRED,
                                tag(id) + " expires at " +
                                std::to_string(t.expiration_time));
    }

    LOG_DEBUG(core::LogCategory::LEDGER,
              tag(id) + ": refund triggered by " + caller.to_hex());
    PST_TRY_VOID(release(t, t.sender, TransferStatus::EXPIRED_AND_REFUNDED));
    return TransferView::of(t, cooldown_, now);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

core::Result<TransferView> TransferLedger::get_transfer(TransferId id) const {
    int64_t now = clock_();
    READ_LOCK(arena_);
    Slot* slot = find_slot(id);
    if (slot == nullptr) {
        return core::make_error(core::ErrorCode::ESCROW_NOT_FOUND, tag(id));
    }
    LOCK(slot->mutex);
    return TransferView::of(slot->record, cooldown_, now);
}

std::vector<TransferView> TransferLedger::list_pending_for(
    const AccountId& account) const {
    return collect_for(account, [](const Transfer& t) {
        return t.status == TransferStatus::PENDING;
    });
}

std::vector<TransferView> TransferLedger::list_history_for(
    const AccountId& account) const {
    return collect_for(account, [](const Transfer& t) {
        return is_terminal(t.status);
    });
}

std::vector<TransferView> TransferLedger::list_by_status_for(
    const AccountId& account, TransferStatus status) const {
    return collect_for(account, [status](const Transfer& t) {
        return t.status == status;
    });
}

size_t TransferLedger::count_history_for(const AccountId& account) const {
    size_t count = 0;
    READ_LOCK(arena_);
    auto it = by_account_.find(account);
    if (it == by_account_.end()) return 0;
    for (TransferId id : it->second) {
        Slot* slot = find_slot(id);
        if (slot == nullptr) continue;
        LOCK(slot->mutex);
        if (is_terminal(slot->record.status)) ++count;
    }
    return count;
}

std::vector<TransferView> TransferLedger::list_transfers_for(
    const AccountId& account, size_t offset, size_t limit) const {
    std::vector<TransferView> out;
    int64_t now = clock_();

    READ_LOCK(arena_);
    auto it = by_account_.find(account);
    if (it == by_account_.end()) return out;

    const auto& ids = it->second;
    for (size_t i = offset; i < ids.size(); ++i) {
        if (limit != 0 && out.size() >= limit) break;
        Slot* slot = find_slot(ids[i]);
        if (slot == nullptr) continue;
        LOCK(slot->mutex);
        out.push_back(TransferView::of(slot->record, cooldown_, now));
    }
    return out;
}

std::vector<TransferView> TransferLedger::list_pending() const {
    std::vector<TransferView> out;
    int64_t now = clock_();

    READ_LOCK(arena_);
    for (const auto& [id, slot] : slots_) {
        LOCK(slot->mutex);
        if (slot->record.status == TransferStatus::PENDING) {
            out.push_back(TransferView::of(slot->record, cooldown_, now));
        }
    }
    return out;
}

Amount TransferLedger::collected_fees(const AssetId& asset) const {
    READ_LOCK(arena_);
    auto it = collected_fees_.find(asset);
    return it == collected_fees_.end() ? 0 : it->second;
}

std::map<AssetId, Amount> TransferLedger::collected_fees() const {
    READ_LOCK(arena_);
    return collected_fees_;
}

size_t TransferLedger::size() const {
    READ_LOCK(arena_);
    return slots_.size();
}

TransferId TransferLedger::next_id() const {
    READ_LOCK(arena_);
    return next_id_;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::vector<Transfer> TransferLedger::export_records() const {
    std::vector<Transfer> out;
    READ_LOCK(arena_);
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        LOCK(slot->mutex);
        out.push_back(slot->record);
    }
    return out;
}

core::Result<void> TransferLedger::import_records(std::vector<Transfer> records,
                                                  TransferId next_id) {
    LOCK(arena_);
    if (!slots_.empty()) {
        return core::make_error(core::ErrorCode::VALIDATION_ERROR,
                                "import into a non-empty ledger");
    }
    if (next_id == 0) {
        return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                "next transfer id must be positive");
    }

    std::map<TransferId, std::unique_ptr<Slot>> slots;
    std::unordered_map<AccountId, std::vector<TransferId>> by_account;
    std::map<AssetId, Amount> fees;

    for (auto& record : records) {
        if (record.id == 0 || record.id >= next_id) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    tag(record.id) + " outside [1, " +
                                    std::to_string(next_id) + ")");
        }
        if (record.net_amount <= 0 || record.fee_amount < 0 ||
            record.sender == record.receiver) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    tag(record.id) + " is inconsistent");
        }
        if (slots.count(record.id) != 0) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "duplicate " + tag(record.id));
        }
        if (record.fee_amount > MAX_AMOUNT - fees[record.asset]) {
            return core::make_error(core::ErrorCode::STORAGE_CORRUPT,
                                    "collected fees overflow");
        }
        fees[record.asset] += record.fee_amount;

        auto slot = std::make_unique<Slot>();
        slot->record = std::move(record);
        slots.emplace(slot->record.id, std::move(slot));
    }

    // Index in ascending id order regardless of the input order.
    for (const auto& [id, slot] : slots) {
        by_account[slot->record.sender].push_back(id);
        by_account[slot->record.receiver].push_back(id);
    }
    std::erase_if(fees, [](const auto& entry) { return entry.second == 0; });

    slots_      = std::move(slots);
    by_account_ = std::move(by_account);
    collected_fees_ = std::move(fees);
    next_id_    = next_id;

    LOG_INFO(core::LogCategory::LEDGER,
             "loaded " + std::to_string(slots_.size()) + " transfers, next id " +
             std::to_string(next_id_));
    return core::make_ok();
}

}  // namespace escrow
