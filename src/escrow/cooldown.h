#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string_view>

namespace escrow {

inline constexpr int64_t DEFAULT_CANCEL_COOLDOWN = 1800;   // 30 minutes

enum class Phase : uint8_t {
    CANCEL_WINDOW,   // only the sender may act (cancel)
    CLAIM_WINDOW,    // only the receiver may act (claim)
    EXPIRED,         // anyone may trigger the refund
};

[[nodiscard]] std::string_view phase_name(Phase phase) noexcept;

// ---------------------------------------------------------------------------
// CooldownPolicy -- time-window predicates for one cancel cooldown period
// ---------------------------------------------------------------------------
// All times are unix seconds.
//
//   cancel window:  now <= created + period
//   claim window:   created + period < now <= expires
//   expired:        now > expires
//
// The cancel and claim windows are adjacent and never overlap, so a claim
// can never race a still-legal cancel.
// ---------------------------------------------------------------------------
class CooldownPolicy {
public:
    /// A negative period is treated as 0.
    explicit CooldownPolicy(int64_t cancel_cooldown = DEFAULT_CANCEL_COOLDOWN) noexcept
        : period_(cancel_cooldown < 0 ? 0 : cancel_cooldown) {}

    [[nodiscard]] int64_t period() const noexcept { return period_; }

    /// Last second at which the sender may still cancel. Saturates.
    [[nodiscard]] int64_t cancel_deadline(int64_t created) const noexcept;

    /// First second at which the receiver may claim.
    [[nodiscard]] int64_t claim_opens_at(int64_t created) const noexcept;

    [[nodiscard]] bool cancel_window_open(int64_t created, int64_t now) const noexcept;

    [[nodiscard]] bool claim_window_open(int64_t created, int64_t now,
                                         int64_t expires) const noexcept;

    [[nodiscard]] static bool is_expired(int64_t now, int64_t expires) noexcept {
        return now > expires;
    }

    /// EXPIRED wins over the other windows once now > expires.
    [[nodiscard]] Phase phase(int64_t created, int64_t now,
                              int64_t expires) const noexcept;

private:
    int64_t period_;
};

}  // namespace escrow
