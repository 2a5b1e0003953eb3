// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/commitment.h"
#include "core/logging.h"
#include "core/random.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <climits>
#include <span>
#include <string>
#include <vector>

namespace crypto {

namespace {

constexpr std::string_view COMMITMENT_TAG = "PST/password-commitment/v2";

}  // namespace

bool constant_time_equal(const core::uint256& a,
                         const core::uint256& b) noexcept {
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

core::Result<core::uint256> Sha3PasswordCommitment::digest(
    const core::uint256& salt, std::string_view password,
    uint32_t iterations) {
    if (iterations == 0 || iterations > static_cast<uint32_t>(INT_MAX)) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
                                "invalid PBKDF2 iteration count " +
                                std::to_string(iterations));
    }

    // The tag keeps these digests apart from any other PBKDF2 use of the
    // same password and salt.
    std::vector<uint8_t> salt_input(COMMITMENT_TAG.begin(), COMMITMENT_TAG.end());
    salt_input.insert(salt_input.end(), salt.data(), salt.data() + salt.size());

    core::uint256 out;
    int rc = PKCS5_PBKDF2_HMAC(
        password.data(),
        static_cast<int>(password.size()),
        salt_input.data(),
        static_cast<int>(salt_input.size()),
        static_cast<int>(iterations),
        EVP_sha3_256(),
        static_cast<int>(out.size()),
        out.data());

    if (rc != 1) {
        unsigned long err = ERR_get_error();
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        return core::make_error(core::ErrorCode::CRYPTO_HASH_FAIL,
                                std::string("PBKDF2 derivation failed: ") + err_buf);
    }
    return out;
}

core::Result<PasswordHash> Sha3PasswordCommitment::commit(
    std::string_view password) const {
    PasswordHash out;
    if (!core::try_get_random_bytes(std::span<uint8_t>(out.salt.data(), out.salt.size()))) {
        LOG_ERROR(core::LogCategory::CRYPTO, "password commitment: RNG failure");
        return core::make_error(core::ErrorCode::CRYPTO_RNG_FAIL,
                                "could not draw a commitment salt");
    }
    out.iterations = iterations_;
    out.digest = PST_TRY(digest(out.salt, password, out.iterations));
    return out;
}

core::Result<bool> Sha3PasswordCommitment::verify(
    std::string_view password, const PasswordHash& stored) const {
    core::uint256 candidate = PST_TRY(digest(stored.salt, password, stored.iterations));
    return constant_time_equal(candidate, stored.digest);
}

}  // namespace crypto
