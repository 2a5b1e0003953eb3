// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/transfer.h"
#include "core/serialize.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace escrow {

std::string_view status_name(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::PENDING:              return "Pending";
        case TransferStatus::CLAIMED:              return "Claimed";
        case TransferStatus::CANCELED:             return "Canceled";
        case TransferStatus::EXPIRED_AND_REFUNDED: return "ExpiredAndRefunded";
    }
    return "Unknown";
}

std::optional<TransferStatus> parse_status(std::string_view name) {
    std::string n(name);
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "pending")  return TransferStatus::PENDING;
    if (n == "claimed")  return TransferStatus::CLAIMED;
    if (n == "canceled" || n == "cancelled") return TransferStatus::CANCELED;
    if (n == "expiredandrefunded" || n == "expired" || n == "refunded") {
        return TransferStatus::EXPIRED_AND_REFUNDED;
    }
    return std::nullopt;
}

void Transfer::serialize(core::DataStream& s) const {
    core::ser_write_u64(s, id);
    core::ser_write_uint160(s, sender);
    core::ser_write_uint160(s, receiver);
    core::ser_write_uint160(s, asset);
    core::ser_write_i64(s, net_amount);
    core::ser_write_i64(s, fee_amount);
    core::ser_write_uint256(s, password_hash.salt);
    core::ser_write_uint256(s, password_hash.digest);
    core::ser_write_u32(s, password_hash.iterations);
    core::ser_write_i64(s, creation_time);
    core::ser_write_i64(s, expiration_time);
    core::ser_write_u8(s, static_cast<uint8_t>(status));
}

Transfer Transfer::deserialize(core::DataStream& s) {
    Transfer t;
    t.id                   = core::ser_read_u64(s);
    t.sender               = core::ser_read_uint160(s);
    t.receiver             = core::ser_read_uint160(s);
    t.asset                = core::ser_read_uint160(s);
    t.net_amount           = core::ser_read_i64(s);
    t.fee_amount           = core::ser_read_i64(s);
    t.password_hash.salt   = core::ser_read_uint256(s);
    t.password_hash.digest = core::ser_read_uint256(s);
    t.password_hash.iterations = core::ser_read_u32(s);
    if (t.password_hash.iterations == 0) {
        throw std::runtime_error("Transfer: zero PBKDF2 iteration count");
    }
    t.creation_time        = core::ser_read_i64(s);
    t.expiration_time      = core::ser_read_i64(s);

    uint8_t raw = core::ser_read_u8(s);
    if (raw > static_cast<uint8_t>(TransferStatus::EXPIRED_AND_REFUNDED)) {
        throw std::runtime_error("Transfer: unknown status " + std::to_string(raw));
    }
    t.status = static_cast<TransferStatus>(raw);
    return t;
}

TransferView TransferView::of(const Transfer& t, const CooldownPolicy& policy,
                              int64_t now) {
    TransferView v;
    v.id              = t.id;
    v.sender          = t.sender;
    v.receiver        = t.receiver;
    v.asset           = t.asset;
    v.net_amount      = t.net_amount;
    v.fee_amount      = t.fee_amount;
    v.creation_time   = t.creation_time;
    v.expiration_time = t.expiration_time;
    v.status          = t.status;
    v.cancel_deadline = policy.cancel_deadline(t.creation_time);
    v.claim_opens_at  = policy.claim_opens_at(t.creation_time);
    v.phase           = policy.phase(t.creation_time, now, t.expiration_time);
    return v;
}

}  // namespace escrow
