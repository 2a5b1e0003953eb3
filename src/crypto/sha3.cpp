// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha3.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

void check(int rc, const char* what) {
    if (rc != 1) {
        throw std::runtime_error(std::string("sha3: ") + what + " failed");
    }
}

}  // namespace

core::uint256 sha3_256(std::span<const uint8_t> data) {
    return Sha3Hasher().write(data).finalize();
}

Sha3Hasher::Sha3Hasher() {
    reset();
}

Sha3Hasher::~Sha3Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Sha3Hasher::Sha3Hasher(Sha3Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha3Hasher& Sha3Hasher::operator=(Sha3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) EVP_MD_CTX_free(ctx_);
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

void Sha3Hasher::reset() {
    if (!ctx_) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("sha3: EVP_MD_CTX_new failed");
    }
    check(EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr), "EVP_DigestInit_ex");
    finalized_ = false;
}

Sha3Hasher& Sha3Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error("sha3: write after finalize");
    }
    if (!data.empty()) {
        check(EVP_DigestUpdate(ctx_, data.data(), data.size()), "EVP_DigestUpdate");
    }
    return *this;
}

Sha3Hasher& Sha3Hasher::write(std::string_view text) {
    return write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

Sha3Hasher& Sha3Hasher::write_u64(uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return write(std::span<const uint8_t>(buf, 8));
}

core::uint256 Sha3Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error("sha3: finalize called twice");
    }
    uint8_t out[32];
    unsigned int len = 0;
    check(EVP_DigestFinal_ex(ctx_, out, &len), "EVP_DigestFinal_ex");
    if (len != 32) throw std::runtime_error("sha3: unexpected digest length");
    finalized_ = true;
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(out, 32));
}

}  // namespace crypto
