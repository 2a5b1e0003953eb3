#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstdint>
#include <limits>

namespace escrow {

/// Asset quantity in indivisible base units.
using Amount = int64_t;

inline constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

using AccountId  = core::uint160;
using AssetId    = core::uint160;
using TransferId = uint64_t;

/// The all-zero asset id denotes the chain-native coin.
inline const AssetId NATIVE_ASSET{};

[[nodiscard]] inline bool is_native(const AssetId& asset) noexcept {
    return asset.is_zero();
}

}  // namespace escrow
