// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/cooldown.h"

#include <limits>

namespace escrow {

std::string_view phase_name(Phase phase) noexcept {
    switch (phase) {
        case Phase::CANCEL_WINDOW: return "CancelWindow";
        case Phase::CLAIM_WINDOW:  return "ClaimWindow";
        case Phase::EXPIRED:       return "Expired";
    }
    return "Unknown";
}

int64_t CooldownPolicy::cancel_deadline(int64_t created) const noexcept {
    if (created > std::numeric_limits<int64_t>::max() - period_) {
        return std::numeric_limits<int64_t>::max();
    }
    return created + period_;
}

int64_t CooldownPolicy::claim_opens_at(int64_t created) const noexcept {
    int64_t deadline = cancel_deadline(created);
    return deadline == std::numeric_limits<int64_t>::max() ? deadline : deadline + 1;
}

bool CooldownPolicy::cancel_window_open(int64_t created, int64_t now) const noexcept {
    return now <= cancel_deadline(created);
}

bool CooldownPolicy::claim_window_open(int64_t created, int64_t now,
                                       int64_t expires) const noexcept {
    return now > cancel_deadline(created) && now <= expires;
}

Phase CooldownPolicy::phase(int64_t created, int64_t now,
                            int64_t expires) const noexcept {
    if (is_expired(now, expires)) return Phase::EXPIRED;
    if (cancel_window_open(created, now)) return Phase::CANCEL_WINDOW;
    return Phase::CLAIM_WINDOW;
}

}  // namespace escrow
