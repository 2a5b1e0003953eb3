#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"
#include "crypto/commitment.h"
#include "escrow/cooldown.h"
#include "escrow/types.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace escrow {

// ---------------------------------------------------------------------------
// TransferStatus
// ---------------------------------------------------------------------------
// PENDING is the only initial and only non-terminal state. Values are
// persisted; do not renumber.
// ---------------------------------------------------------------------------
enum class TransferStatus : uint8_t {
    PENDING              = 0,
    CLAIMED              = 1,
    CANCELED             = 2,
    EXPIRED_AND_REFUNDED = 3,
};

[[nodiscard]] std::string_view status_name(TransferStatus status) noexcept;

/// Case-insensitive; also accepts the short forms "expired" and "refunded".
[[nodiscard]] std::optional<TransferStatus> parse_status(std::string_view name);

[[nodiscard]] inline bool is_terminal(TransferStatus status) noexcept {
    return status != TransferStatus::PENDING;
}

// ---------------------------------------------------------------------------
// Transfer -- one escrow record as the ledger stores it
// ---------------------------------------------------------------------------
struct Transfer {
    TransferId             id = 0;
    AccountId              sender;
    AccountId              receiver;
    AssetId                asset;
    Amount                 net_amount = 0;    // credited on release
    Amount                 fee_amount = 0;    // frozen at creation
    crypto::PasswordHash   password_hash;
    int64_t                creation_time = 0;
    int64_t                expiration_time = 0;
    TransferStatus         status = TransferStatus::PENDING;

    [[nodiscard]] bool involves(const AccountId& account) const noexcept {
        return sender == account || receiver == account;
    }

    void serialize(core::DataStream& s) const;

    /// Throws std::runtime_error on truncated input or an unknown status.
    static Transfer deserialize(core::DataStream& s);
};

// ---------------------------------------------------------------------------
// TransferView -- what queries return: no password material, plus the
// window timestamps a client needs to render countdowns
// ---------------------------------------------------------------------------
struct TransferView {
    TransferId     id = 0;
    AccountId      sender;
    AccountId      receiver;
    AssetId        asset;
    Amount         net_amount = 0;
    Amount         fee_amount = 0;
    int64_t        creation_time = 0;
    int64_t        expiration_time = 0;
    TransferStatus status = TransferStatus::PENDING;

    int64_t        cancel_deadline = 0;
    int64_t        claim_opens_at = 0;
    Phase          phase = Phase::CANCEL_WINDOW;

    [[nodiscard]] static TransferView of(const Transfer& t,
                                         const CooldownPolicy& policy,
                                         int64_t now);
};

}  // namespace escrow
