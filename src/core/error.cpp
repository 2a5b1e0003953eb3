// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:       return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:    return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_UNDERFLOW:   return "PARSE_UNDERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:  return "PARSE_BAD_FORMAT";

        // Validation
        case ErrorCode::VALIDATION_ERROR:  return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:  return "VALIDATION_RANGE";

        // Network
        case ErrorCode::NETWORK_ERROR:     return "NETWORK_ERROR";
        case ErrorCode::NETWORK_REFUSED:   return "NETWORK_REFUSED";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:      return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:  return "CRYPTO_HASH_FAIL";
        case ErrorCode::CRYPTO_RNG_FAIL:   return "CRYPTO_RNG_FAIL";

        // Storage
        case ErrorCode::STORAGE_ERROR:     return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND: return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:   return "STORAGE_CORRUPT";

        // RPC
        case ErrorCode::RPC_ERROR:         return "RPC_ERROR";
        case ErrorCode::RPC_INVALID_REQ:   return "RPC_INVALID_REQ";
        case ErrorCode::RPC_METHOD_MISS:   return "RPC_METHOD_MISS";
        case ErrorCode::RPC_FORBIDDEN:     return "RPC_FORBIDDEN";

        // Internal
        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:   return "NOT_IMPLEMENTED";

        // Escrow ledger
        case ErrorCode::ESCROW_NOT_FOUND:        return "NotFound";
        case ErrorCode::ESCROW_NOT_SENDER:       return "NotSender";
        case ErrorCode::ESCROW_NOT_RECEIVER:     return "NotReceiver";
        case ErrorCode::ESCROW_NOT_PENDING:      return "NotPending";
        case ErrorCode::ESCROW_COOLDOWN_ELAPSED: return "CooldownElapsed";
        case ErrorCode::ESCROW_CLAIM_NOT_OPEN:   return "ClaimNotYetOpen";
        case ErrorCode::ESCROW_EXPIRED:          return "TransferExpired";
        case ErrorCode::ESCROW_BAD_PASSWORD:     return "IncorrectPassword";
        case ErrorCode::ESCROW_PASSWORD_MISSING: return "PasswordMissing";
        case ErrorCode::ESCROW_PASSWORD_SHORT:   return "PasswordTooShort";
        case ErrorCode::ESCROW_AMOUNT_TOO_LOW:   return "AmountTooLow";
        case ErrorCode::ESCROW_SELF_TRANSFER:    return "SelfTransferNotAllowed";
        case ErrorCode::ESCROW_BAD_FEE_CONFIG:   return "InvalidFeeConfiguration";
        case ErrorCode::ESCROW_ASSET_MOVE_FAIL:  return "AssetMovementFailed";
        case ErrorCode::ESCROW_BAD_EXPIRATION:   return "InvalidExpiration";
        case ErrorCode::ESCROW_NOT_EXPIRED:      return "NotYetExpired";
        case ErrorCode::ESCROW_AMOUNT_RANGE:     return "AmountOutOfRange";
        case ErrorCode::ESCROW_INSUFFICIENT:     return "InsufficientFunds";
        case ErrorCode::ESCROW_RESERVED_SENDER:  return "ReservedSender";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line() << ']';
    }

    return oss.str();
}

} // namespace core
