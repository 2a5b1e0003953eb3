// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/util.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace rpc {

// ===========================================================================
// Parameter extraction
// ===========================================================================

namespace {

[[noreturn]] void bad_param(size_t index, const std::string& what) {
    throw RpcException(RpcError::INVALID_PARAMS,
                       "Parameter " + std::to_string(index) + ": " + what);
}

std::optional<int64_t> parse_decimal(std::string_view s) {
    int64_t v = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || p != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

int64_t integer_param(const JsonValue& params, size_t index) {
    const JsonValue& v = param_value(params, index);
    if (v.is_int()) return v.get_int();
    if (v.is_double()) {
        double d = v.get_double();
        if (!std::isfinite(d) || std::fabs(d) >= 9.2e18 || std::trunc(d) != d) {
            bad_param(index, "expected an integer");
        }
        return static_cast<int64_t>(d);
    }
    if (v.is_string()) {
        if (auto parsed = parse_decimal(v.get_string())) return *parsed;
    }
    bad_param(index, "expected an integer");
}

core::uint160 parse_id160(size_t index, const std::string& text,
                          const char* what) {
    try {
        return core::uint160::from_hex(text);
    } catch (const std::invalid_argument&) {
        bad_param(index, std::string("invalid ") + what +
                         " (expected 40 hex characters)");
    }
}

} // namespace

bool param_exists(const JsonValue& params, size_t index) {
    return params.is_array() && index < params.size() &&
           !params[index].is_null();
}

size_t param_count(const JsonValue& params) {
    return params.is_array() ? params.size() : 0;
}

const JsonValue& param_value(const JsonValue& params, size_t index) {
    if (!params.is_array()) {
        throw RpcException(RpcError::INVALID_PARAMS,
                           "params must be a positional array");
    }
    if (!param_exists(params, index)) {
        bad_param(index, "missing required value");
    }
    return params[index];
}

std::string param_string(const JsonValue& params, size_t index) {
    const JsonValue& v = param_value(params, index);
    if (!v.is_string()) bad_param(index, "expected a string");
    return v.get_string();
}

std::string param_string(const JsonValue& params, size_t index,
                         const std::string& default_val) {
    if (!param_exists(params, index)) return default_val;
    return param_string(params, index);
}

int64_t param_int(const JsonValue& params, size_t index) {
    const JsonValue& v = param_value(params, index);
    if (!v.is_number()) bad_param(index, "expected a number");
    return integer_param(params, index);
}

int64_t param_int(const JsonValue& params, size_t index, int64_t default_val) {
    if (!param_exists(params, index)) return default_val;
    return param_int(params, index);
}

uint64_t param_id(const JsonValue& params, size_t index) {
    int64_t id = integer_param(params, index);
    if (id <= 0) bad_param(index, "transfer id must be positive");
    return static_cast<uint64_t>(id);
}

core::uint160 param_account(const JsonValue& params, size_t index) {
    return parse_id160(index, param_string(params, index), "account");
}

core::uint160 param_asset(const JsonValue& params, size_t index) {
    std::string text = param_string(params, index, "");
    if (text.empty() || text == "native") return core::uint160{};
    return parse_id160(index, text, "asset");
}

int64_t param_amount(const JsonValue& params, size_t index) {
    return integer_param(params, index);
}

// ===========================================================================
// Error mapping
// ===========================================================================

RpcError rpc_code_for(core::ErrorCode code) noexcept {
    using core::ErrorCode;
    switch (code) {
        case ErrorCode::ESCROW_NOT_FOUND:        return RpcError::TRANSFER_NOT_FOUND;
        case ErrorCode::ESCROW_NOT_SENDER:       return RpcError::TRANSFER_NOT_SENDER;
        case ErrorCode::ESCROW_NOT_RECEIVER:     return RpcError::TRANSFER_NOT_RECEIVER;
        case ErrorCode::ESCROW_NOT_PENDING:      return RpcError::TRANSFER_NOT_PENDING;
        case ErrorCode::ESCROW_COOLDOWN_ELAPSED: return RpcError::TRANSFER_COOLDOWN_OVER;
        case ErrorCode::ESCROW_CLAIM_NOT_OPEN:   return RpcError::TRANSFER_CLAIM_NOT_OPEN;
        case ErrorCode::ESCROW_EXPIRED:          return RpcError::TRANSFER_EXPIRED;
        case ErrorCode::ESCROW_BAD_PASSWORD:     return RpcError::TRANSFER_BAD_PASSWORD;
        case ErrorCode::ESCROW_PASSWORD_MISSING: return RpcError::TRANSFER_NO_PASSWORD;
        case ErrorCode::ESCROW_PASSWORD_SHORT:   return RpcError::TRANSFER_SHORT_PASSWORD;
        case ErrorCode::ESCROW_AMOUNT_TOO_LOW:   return RpcError::TRANSFER_AMOUNT_TOO_LOW;
        case ErrorCode::ESCROW_SELF_TRANSFER:    return RpcError::TRANSFER_SELF;
        case ErrorCode::ESCROW_BAD_FEE_CONFIG:   return RpcError::TRANSFER_BAD_FEE_CONFIG;
        case ErrorCode::ESCROW_ASSET_MOVE_FAIL:  return RpcError::ASSET_MOVEMENT_FAILED;
        case ErrorCode::ESCROW_BAD_EXPIRATION:   return RpcError::TRANSFER_BAD_EXPIRATION;
        case ErrorCode::ESCROW_NOT_EXPIRED:      return RpcError::TRANSFER_NOT_EXPIRED;
        case ErrorCode::ESCROW_AMOUNT_RANGE:     return RpcError::TRANSFER_AMOUNT_RANGE;
        case ErrorCode::ESCROW_INSUFFICIENT:     return RpcError::INSUFFICIENT_FUNDS;
        case ErrorCode::ESCROW_RESERVED_SENDER:  return RpcError::RESERVED_SENDER;
        case ErrorCode::STORAGE_ERROR:
        case ErrorCode::STORAGE_NOT_FOUND:
        case ErrorCode::STORAGE_CORRUPT:
            return RpcError::STORAGE_ERROR;
        case ErrorCode::PARSE_ERROR:
        case ErrorCode::PARSE_OVERFLOW:
        case ErrorCode::PARSE_UNDERFLOW:
        case ErrorCode::PARSE_BAD_FORMAT:
        case ErrorCode::VALIDATION_ERROR:
        case ErrorCode::VALIDATION_RANGE:
            return RpcError::INVALID_PARAMETER;
        default:
            return RpcError::MISC_ERROR;
    }
}

RpcResponse error_response(const core::Error& err, int64_t id) {
    JsonValue data = JsonValue::object();
    data["kind"] = core::error_code_name(err.code());
    data["code"] = static_cast<int64_t>(err.code());
    std::string message = err.message().empty()
                              ? std::string(core::error_code_name(err.code()))
                              : err.message();
    return make_error(rpc_code_for(err.code()), message, data, id);
}

// ===========================================================================
// Base64 / HTTP Basic auth
// ===========================================================================

namespace {

constexpr char B64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_b64_table() {
    std::array<int, 256> t{};
    for (auto& e : t) e = -1;
    for (int i = 0; i < 64; ++i) {
        t[static_cast<unsigned char>(B64_ALPHABET[i])] = i;
    }
    return t;
}

constexpr auto B64_TABLE = make_b64_table();

} // namespace

std::string base64_encode(std::string_view input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    for (size_t i = 0; i < input.size(); i += 3) {
        size_t n = std::min<size_t>(3, input.size() - i);
        uint32_t chunk = static_cast<uint32_t>(static_cast<uint8_t>(input[i])) << 16;
        if (n > 1) chunk |= static_cast<uint32_t>(static_cast<uint8_t>(input[i + 1])) << 8;
        if (n > 2) chunk |= static_cast<uint32_t>(static_cast<uint8_t>(input[i + 2]));

        out += B64_ALPHABET[(chunk >> 18) & 0x3F];
        out += B64_ALPHABET[(chunk >> 12) & 0x3F];
        out += n > 1 ? B64_ALPHABET[(chunk >> 6) & 0x3F] : '=';
        out += n > 2 ? B64_ALPHABET[chunk & 0x3F] : '=';
    }
    return out;
}

std::optional<std::string> base64_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size() * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') break;
        int v = B64_TABLE[static_cast<unsigned char>(c)];
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((acc >> bits) & 0xFF);
        }
    }
    return out;
}

bool verify_auth(std::string_view auth_header,
                 const std::string& rpc_user,
                 const std::string& rpc_password) {
    constexpr std::string_view prefix = "Basic ";
    if (!auth_header.starts_with(prefix)) return false;

    auto decoded = base64_decode(auth_header.substr(prefix.size()));
    if (!decoded) return false;

    std::string expected = rpc_user + ":" + rpc_password;
    if (decoded->size() != expected.size()) return false;
    return CRYPTO_memcmp(decoded->data(), expected.data(), expected.size()) == 0;
}

} // namespace rpc
