#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_RPC_UTIL_H
#define PST_RPC_UTIL_H

#include "core/error.h"
#include "core/types.h"
#include "rpc/request.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// RpcException -- thrown by handlers and parameter helpers
// ---------------------------------------------------------------------------
// The server turns it into an error response carrying code().
// ---------------------------------------------------------------------------
class RpcException : public std::runtime_error {
public:
    RpcException(RpcError code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] RpcError code() const noexcept { return code_; }

private:
    RpcError code_;
};

// ---------------------------------------------------------------------------
// Positional parameter extraction
// ---------------------------------------------------------------------------
// Required variants throw RpcException(INVALID_PARAMS) when the parameter
// is missing or has the wrong type. A JSON null counts as missing.
// ---------------------------------------------------------------------------

[[nodiscard]] bool param_exists(const JsonValue& params, size_t index);
[[nodiscard]] size_t param_count(const JsonValue& params);

const JsonValue& param_value(const JsonValue& params, size_t index);

std::string param_string(const JsonValue& params, size_t index);
std::string param_string(const JsonValue& params, size_t index,
                         const std::string& default_val);

int64_t param_int(const JsonValue& params, size_t index);
int64_t param_int(const JsonValue& params, size_t index, int64_t default_val);

/// Transfer id: a positive integer (JSON number or decimal string).
uint64_t param_id(const JsonValue& params, size_t index);

/// Account id: 40 hex chars, optional "0x".
core::uint160 param_account(const JsonValue& params, size_t index);

/// Asset id: 40 hex chars, or "native" / "" for the native asset. A
/// missing parameter is the native asset.
core::uint160 param_asset(const JsonValue& params, size_t index);

/// Amount in base units: a JSON integer or a decimal integer string.
/// The sign is not checked here; the ledger rejects non-positive amounts.
int64_t param_amount(const JsonValue& params, size_t index);

// ---------------------------------------------------------------------------
// core::Error -> JSON-RPC error
// ---------------------------------------------------------------------------

/// Maps a ledger/core error code onto the RPC error space.
[[nodiscard]] RpcError rpc_code_for(core::ErrorCode code) noexcept;

/// Error response whose "data" member carries the ledger error name, e.g.
/// {"code":-105,"message":"...","data":{"kind":"ClaimNotYetOpen","code":1005}}
RpcResponse error_response(const core::Error& err, int64_t id);

// ---------------------------------------------------------------------------
// HTTP Basic authentication
// ---------------------------------------------------------------------------

std::string base64_encode(std::string_view input);

/// nullopt on characters outside the base64 alphabet.
std::optional<std::string> base64_decode(std::string_view input);

/// Checks an "Authorization: Basic ..." header value. The credential
/// comparison is constant-time.
[[nodiscard]] bool verify_auth(std::string_view auth_header,
                               const std::string& rpc_user,
                               const std::string& rpc_password);

} // namespace rpc

#endif // PST_RPC_UTIL_H
