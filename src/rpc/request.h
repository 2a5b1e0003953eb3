#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PST_RPC_REQUEST_H
#define PST_RPC_REQUEST_H

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// JsonValue -- null, bool, int64, double, string, array or object
// ---------------------------------------------------------------------------

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

class JsonValue {
public:
    using Array  = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue()                   : v_(NullValue{}) {}
    JsonValue(std::nullptr_t)     : v_(NullValue{}) {}                      // NOLINT
    JsonValue(bool b)             : v_(b) {}                                // NOLINT
    JsonValue(int i)              : v_(static_cast<int64_t>(i)) {}          // NOLINT
    JsonValue(int64_t i)          : v_(i) {}                                // NOLINT
    JsonValue(uint64_t i)         : v_(static_cast<int64_t>(i)) {}          // NOLINT
    JsonValue(double d)           : v_(d) {}                                // NOLINT
    JsonValue(const char* s)      : v_(std::string(s)) {}                   // NOLINT
    JsonValue(std::string s)      : v_(std::move(s)) {}                     // NOLINT
    JsonValue(std::string_view s) : v_(std::string(s)) {}                   // NOLINT
    JsonValue(Array a)            : v_(std::move(a)) {}                     // NOLINT
    JsonValue(Object o)           : v_(std::move(o)) {}                     // NOLINT

    [[nodiscard]] static JsonValue object() { return JsonValue(Object{}); }
    [[nodiscard]] static JsonValue array()  { return JsonValue(Array{}); }

    [[nodiscard]] bool is_null()   const { return holds<NullValue>(); }
    [[nodiscard]] bool is_bool()   const { return holds<bool>(); }
    [[nodiscard]] bool is_int()    const { return holds<int64_t>(); }
    [[nodiscard]] bool is_double() const { return holds<double>(); }
    [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const { return holds<std::string>(); }
    [[nodiscard]] bool is_array()  const { return holds<Array>(); }
    [[nodiscard]] bool is_object() const { return holds<Object>(); }

    // Accessors throw std::runtime_error on a type mismatch.
    [[nodiscard]] bool get_bool() const { return as<bool>("bool"); }
    [[nodiscard]] int64_t get_int() const;
    [[nodiscard]] double get_double() const;
    [[nodiscard]] const std::string& get_string() const { return as<std::string>("string"); }
    [[nodiscard]] const Array& get_array() const { return as<Array>("array"); }
    [[nodiscard]] Array& get_array() { return as<Array>("array"); }
    [[nodiscard]] const Object& get_object() const { return as<Object>("object"); }
    [[nodiscard]] Object& get_object() { return as<Object>("object"); }

    /// Turns a null value into an object on first use.
    JsonValue& operator[](const std::string& key);

    /// Missing keys (or a non-object) read as null.
    const JsonValue& operator[](const std::string& key) const;

    const JsonValue& operator[](size_t index) const { return get_array().at(index); }

    /// Turns a null value into an array on first use.
    void push_back(JsonValue val);

    [[nodiscard]] bool has_key(const std::string& key) const;
    [[nodiscard]] size_t size() const;

    bool operator==(const JsonValue& other) const { return v_ == other.v_; }

private:
    std::variant<NullValue, bool, int64_t, double, std::string, Array, Object> v_;

    template <typename T>
    [[nodiscard]] bool holds() const { return std::holds_alternative<T>(v_); }

    template <typename T>
    const T& as(const char* what) const {
        if (auto* p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("JsonValue: not a ") + what);
    }
    template <typename T>
    T& as(const char* what) {
        if (auto* p = std::get_if<T>(&v_)) return *p;
        throw std::runtime_error(std::string("JsonValue: not a ") + what);
    }
};

/// Throws std::runtime_error on malformed input.
JsonValue parse_json(std::string_view input);

std::string json_serialize(const JsonValue& val);

/// Indented form, used by the command-line client output.
std::string json_serialize_pretty(const JsonValue& val, int indent = 2);

// ---------------------------------------------------------------------------
// RpcError -- JSON-RPC 2.0 codes plus application codes
// ---------------------------------------------------------------------------
// Application codes are negative and grouped by concern. Ledger failures
// keep their ledger name in the error "data" member.
// ---------------------------------------------------------------------------

enum class RpcError : int {
    PARSE_ERROR      = -32700,
    INVALID_REQUEST  = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS   = -32602,
    INTERNAL_ERROR   = -32603,

    MISC_ERROR        = -1,
    TYPE_ERROR        = -3,
    INVALID_ACCOUNT   = -5,
    INVALID_PARAMETER = -8,
    STORAGE_ERROR     = -20,

    // Ledger rule violations, one per escrow error code.
    TRANSFER_NOT_FOUND      = -100,
    TRANSFER_NOT_SENDER     = -101,
    TRANSFER_NOT_RECEIVER   = -102,
    TRANSFER_NOT_PENDING    = -103,
    TRANSFER_COOLDOWN_OVER  = -104,
    TRANSFER_CLAIM_NOT_OPEN = -105,
    TRANSFER_EXPIRED        = -106,
    TRANSFER_BAD_PASSWORD   = -107,
    TRANSFER_NO_PASSWORD    = -108,
    TRANSFER_SHORT_PASSWORD = -109,
    TRANSFER_AMOUNT_TOO_LOW = -110,
    TRANSFER_SELF           = -111,
    TRANSFER_BAD_FEE_CONFIG = -112,
    ASSET_MOVEMENT_FAILED   = -113,
    TRANSFER_BAD_EXPIRATION = -114,
    TRANSFER_NOT_EXPIRED    = -115,
    TRANSFER_AMOUNT_RANGE   = -116,
    INSUFFICIENT_FUNDS      = -117,
    RESERVED_SENDER         = -118,
};

// ---------------------------------------------------------------------------
// RpcRequest / RpcResponse
// ---------------------------------------------------------------------------

struct RpcRequest {
    std::string method;
    JsonValue   params;      // array or object
    int64_t     id = 0;

    /// Throws std::runtime_error when "method" is missing or "params" has
    /// the wrong shape.
    static RpcRequest from_json(const JsonValue& val);
};

struct RpcResponse {
    JsonValue result;
    JsonValue error;   // null on success
    int64_t   id = 0;

    [[nodiscard]] bool ok() const { return error.is_null(); }

    [[nodiscard]] JsonValue to_json() const;
    [[nodiscard]] std::string serialize() const;
};

RpcResponse make_result(JsonValue result, int64_t id);

RpcResponse make_error(RpcError code, const std::string& message, int64_t id = 0);

RpcResponse make_error(RpcError code, const std::string& message,
                       const JsonValue& data, int64_t id = 0);

} // namespace rpc

#endif // PST_RPC_REQUEST_H
