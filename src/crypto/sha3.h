#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA3-256 (FIPS 202) over the OpenSSL EVP API.
// OpenSSL failures surface as std::runtime_error.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

[[nodiscard]] core::uint256 sha3_256(std::span<const uint8_t> data);

/// Incremental SHA3-256. Move-only; finalize() consumes the state until
/// reset().
class Sha3Hasher {
public:
    Sha3Hasher();
    ~Sha3Hasher();

    Sha3Hasher(const Sha3Hasher&) = delete;
    Sha3Hasher& operator=(const Sha3Hasher&) = delete;

    Sha3Hasher(Sha3Hasher&& other) noexcept;
    Sha3Hasher& operator=(Sha3Hasher&& other) noexcept;

    Sha3Hasher& write(std::span<const uint8_t> data);
    Sha3Hasher& write(std::string_view text);

    /// 8 bytes little-endian. Used to length-prefix variable fields so
    /// that ("ab","c") and ("a","bc") hash differently.
    Sha3Hasher& write_u64(uint64_t v);

    [[nodiscard]] core::uint256 finalize();

    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
};

}  // namespace crypto
