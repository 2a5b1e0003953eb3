// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/fee_schedule.h"
#include "core/logging.h"

#include <string>

namespace escrow {

namespace {

int select_tier(Amount amount, const FeeTiers& tiers) noexcept {
    if (amount <= tiers.limit_one) return 1;
    if (amount <= tiers.limit_two) return 2;
    return 3;
}

uint64_t tier_rate(int tier, const FeeRates& rates) noexcept {
    switch (tier) {
        case 1:  return rates.rate_one;
        case 2:  return rates.rate_two;
        default: return rates.rate_three;
    }
}

}  // namespace

core::Result<Amount> compute_fee(Amount amount, const FeeTiers& tiers,
                                 const FeeRates& rates, uint64_t scaling) {
    if (scaling == 0) {
        return core::make_error(core::ErrorCode::ESCROW_BAD_FEE_CONFIG,
                                "fee scaling factor is zero");
    }
    if (amount < 0) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "negative amount " + std::to_string(amount));
    }

    uint64_t rate = tier_rate(select_tier(amount, tiers), rates);
    unsigned __int128 fee = static_cast<unsigned __int128>(amount) * rate / scaling;
    if (fee > static_cast<unsigned __int128>(MAX_AMOUNT)) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "fee for " + std::to_string(amount) +
                                " exceeds the amount range");
    }
    return static_cast<Amount>(fee);
}

// ===========================================================================
// FeeSchedule
// ===========================================================================

core::Result<FeeSchedule> FeeSchedule::create(const FeeTiers& tiers,
                                              const FeeRates& rates,
                                              uint64_t scaling) {
    if (scaling == 0) {
        return core::make_error(core::ErrorCode::ESCROW_BAD_FEE_CONFIG,
                                "fee scaling factor is zero");
    }
    if (tiers.limit_one < 0 || tiers.limit_two < 0) {
        return core::make_error(core::ErrorCode::ESCROW_BAD_FEE_CONFIG,
                                "fee tier limits must not be negative");
    }
    if (tiers.limit_one > tiers.limit_two) {
        return core::make_error(core::ErrorCode::ESCROW_BAD_FEE_CONFIG,
                                "fee tier limit one (" + std::to_string(tiers.limit_one) +
                                ") above limit two (" + std::to_string(tiers.limit_two) + ")");
    }
    return FeeSchedule(tiers, rates, scaling);
}

FeeSchedule FeeSchedule::defaults() {
    return FeeSchedule(FeeTiers{}, FeeRates{}, DEFAULT_FEE_SCALING);
}

int FeeSchedule::tier_for(Amount amount) const noexcept {
    return select_tier(amount, tiers_);
}

uint64_t FeeSchedule::rate_for(Amount amount) const noexcept {
    return tier_rate(tier_for(amount), rates_);
}

core::Result<Amount> FeeSchedule::compute_fee(Amount amount) const {
    return escrow::compute_fee(amount, tiers_, rates_, scaling_);
}

core::Result<FeeQuote> FeeSchedule::quote(Amount amount) const {
    FeeQuote q;
    q.tier = tier_for(amount);
    q.rate = rate_for(amount);
    q.fee  = PST_TRY(compute_fee(amount));
    if (amount > MAX_AMOUNT - q.fee) {
        return core::make_error(core::ErrorCode::ESCROW_AMOUNT_RANGE,
                                "amount plus fee exceeds the amount range");
    }
    q.total = amount + q.fee;

    LOG_TRACE(core::LogCategory::FEES,
              "quote " + std::to_string(amount) + ": tier " + std::to_string(q.tier) +
              " fee " + std::to_string(q.fee));
    return q;
}

}  // namespace escrow
