#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <cstdint>
#include <string_view>

namespace crypto {

/// PBKDF2 work factor for new password commitments.
inline constexpr uint32_t PBKDF2_ITERATIONS = 100000;

// ---------------------------------------------------------------------------
// PasswordHash -- stored commitment to a claim password
// ---------------------------------------------------------------------------
struct PasswordHash {
    core::uint256 salt;
    core::uint256 digest;
    uint32_t      iterations = 0;   // PBKDF2 rounds the digest was made with

    bool operator==(const PasswordHash&) const = default;
};

// ---------------------------------------------------------------------------
// PasswordCommitment -- one-way commitment scheme for claim passwords
// ---------------------------------------------------------------------------
// The ledger only ever calls commit() on create and verify() on claim, so
// the hash function and the comparison can change without touching ledger
// transitions. Implementations must be thread-safe.
// ---------------------------------------------------------------------------
class PasswordCommitment {
public:
    virtual ~PasswordCommitment() = default;

    /// Fresh salt per call: committing the same password twice yields
    /// different hashes.
    [[nodiscard]] virtual core::Result<PasswordHash> commit(
        std::string_view password) const = 0;

    /// true on match. The error path is reserved for a failing primitive,
    /// never for a mismatch.
    [[nodiscard]] virtual core::Result<bool> verify(
        std::string_view password, const PasswordHash& stored) const = 0;
};

// ---------------------------------------------------------------------------
// Sha3PasswordCommitment
// ---------------------------------------------------------------------------
// digest = PBKDF2-HMAC-SHA3-256(pw, tag || salt, iterations) with a random
// 32-byte salt. New commitments use the instance's iteration count;
// verify() uses the count stored in the hash. Digests are compared with
// CRYPTO_memcmp.
// ---------------------------------------------------------------------------
class Sha3PasswordCommitment final : public PasswordCommitment {
public:
    explicit Sha3PasswordCommitment(uint32_t iterations = PBKDF2_ITERATIONS)
        : iterations_(iterations) {}

    [[nodiscard]] uint32_t iterations() const { return iterations_; }

    [[nodiscard]] core::Result<PasswordHash> commit(
        std::string_view password) const override;

    [[nodiscard]] core::Result<bool> verify(
        std::string_view password, const PasswordHash& stored) const override;

    /// Deterministic digest for a given salt and work factor. Fails with
    /// CRYPTO_ERROR for a zero iteration count. Exposed for tests.
    [[nodiscard]] static core::Result<core::uint256> digest(
        const core::uint256& salt, std::string_view password,
        uint32_t iterations);

private:
    uint32_t iterations_;
};

/// Constant-time equality of two 32-byte values.
[[nodiscard]] bool constant_time_equal(const core::uint256& a,
                                       const core::uint256& b) noexcept;

}  // namespace crypto
