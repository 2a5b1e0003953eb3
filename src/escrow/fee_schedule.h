#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "escrow/types.h"

#include <cstdint>

namespace escrow {

struct FeeTiers {
    Amount limit_one = 100;
    Amount limit_two = 1000;
};

/// Rates are numerators over FeeSchedule::scaling().
struct FeeRates {
    uint64_t rate_one   = 100;
    uint64_t rate_two   = 50;
    uint64_t rate_three = 25;
};

inline constexpr uint64_t DEFAULT_FEE_SCALING = 10000;

struct FeeQuote {
    int      tier  = 1;   // 1, 2 or 3
    uint64_t rate  = 0;
    Amount   fee   = 0;
    Amount   total = 0;   // amount + fee, what the sender is charged
};

/// fee = floor(amount * rate / scaling), rate picked by tier:
///   amount <= limit_one              -> rate_one
///   limit_one < amount <= limit_two  -> rate_two
///   otherwise                        -> rate_three
/// The product is formed in 128 bits. Fails with ESCROW_BAD_FEE_CONFIG
/// when scaling is 0 and ESCROW_AMOUNT_RANGE for a negative amount or a
/// fee beyond MAX_AMOUNT.
[[nodiscard]] core::Result<Amount> compute_fee(Amount amount,
                                               const FeeTiers& tiers,
                                               const FeeRates& rates,
                                               uint64_t scaling);

// ---------------------------------------------------------------------------
// FeeSchedule -- validated, immutable fee configuration
// ---------------------------------------------------------------------------
// The ledger charges fees and the estimatefee preview quotes them through
// the same instance, so a preview always matches the charged amount.
// ---------------------------------------------------------------------------
class FeeSchedule {
public:
    /// Rejects scaling == 0, negative limits and limit_one > limit_two.
    [[nodiscard]] static core::Result<FeeSchedule> create(
        const FeeTiers& tiers, const FeeRates& rates, uint64_t scaling);

    /// 100 / 1000 limits, 100 / 50 / 25 rates over 10000.
    [[nodiscard]] static FeeSchedule defaults();

    [[nodiscard]] int tier_for(Amount amount) const noexcept;
    [[nodiscard]] uint64_t rate_for(Amount amount) const noexcept;

    [[nodiscard]] core::Result<Amount> compute_fee(Amount amount) const;

    /// Fails with ESCROW_AMOUNT_RANGE when amount + fee overflows.
    [[nodiscard]] core::Result<FeeQuote> quote(Amount amount) const;

    [[nodiscard]] const FeeTiers& tiers() const noexcept { return tiers_; }
    [[nodiscard]] const FeeRates& rates() const noexcept { return rates_; }
    [[nodiscard]] uint64_t scaling() const noexcept { return scaling_; }

private:
    FeeSchedule(const FeeTiers& tiers, const FeeRates& rates, uint64_t scaling)
        : tiers_(tiers), rates_(rates), scaling_(scaling) {}

    FeeTiers tiers_;
    FeeRates rates_;
    uint64_t scaling_;
};

}  // namespace escrow
