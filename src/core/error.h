#pragma once
// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the PST stack
enum class ErrorCode : uint16_t {
    NONE              = 0,
    // Parsing / serialization (100-199)
    PARSE_ERROR       = 100, PARSE_OVERFLOW  = 101,
    PARSE_UNDERFLOW   = 102, PARSE_BAD_FORMAT = 103,
    // Validation (200-299)
    VALIDATION_ERROR  = 200, VALIDATION_RANGE = 201,
    // Network (300-399)
    NETWORK_ERROR     = 300, NETWORK_REFUSED = 302,
    // Cryptography (400-499)
    CRYPTO_ERROR      = 400, CRYPTO_HASH_FAIL = 401,
    CRYPTO_RNG_FAIL   = 404,
    // Storage (500-599)
    STORAGE_ERROR     = 500, STORAGE_NOT_FOUND = 501,
    STORAGE_CORRUPT   = 502,
    // RPC (700-799)
    RPC_ERROR         = 700, RPC_INVALID_REQ = 701,
    RPC_METHOD_MISS   = 702, RPC_FORBIDDEN   = 703,
    // Internal (900-999)
    INTERNAL_ERROR    = 900, NOT_IMPLEMENTED = 901,
    // Escrow ledger (1000-1099)
    ESCROW_NOT_FOUND         = 1000,
    ESCROW_NOT_SENDER        = 1001,
    ESCROW_NOT_RECEIVER      = 1002,
    ESCROW_NOT_PENDING       = 1003,
    ESCROW_COOLDOWN_ELAPSED  = 1004,
    ESCROW_CLAIM_NOT_OPEN    = 1005,
    ESCROW_EXPIRED           = 1006,
    ESCROW_BAD_PASSWORD      = 1007,
    ESCROW_PASSWORD_MISSING  = 1008,
    ESCROW_PASSWORD_SHORT    = 1009,
    ESCROW_AMOUNT_TOO_LOW    = 1010,
    ESCROW_SELF_TRANSFER     = 1011,
    ESCROW_BAD_FEE_CONFIG    = 1012,
    ESCROW_ASSET_MOVE_FAIL   = 1013,
    ESCROW_BAD_EXPIRATION    = 1014,
    ESCROW_NOT_EXPIRED       = 1015,
    ESCROW_AMOUNT_RANGE      = 1016,
    ESCROW_INSUFFICIENT      = 1017,
    ESCROW_RESERVED_SENDER   = 1018,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    // map: Result<T,E> -> (T -> U) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) return Result<U, E>{func(std::get<T>(storage_))};
        return Result<U, E>{std::get<E>(storage_)};
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<T>(storage_));
        return R{std::get<E>(storage_)};
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// PST_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = PST_TRY(some_result_expr);
#define PST_TRY(expr)                                                     \
    ({                                                                    \
        auto&& _pst_res = (expr);                                         \
        if (!_pst_res.ok()) return std::move(_pst_res).error();           \
        std::move(_pst_res).value();                                      \
    })

// PST_TRY_ASSIGN: portable alternative (no statement-expressions)
// Usage:  PST_TRY_ASSIGN(val, some_result_expr);
#define PST_TRY_ASSIGN(var, expr)                                         \
    auto _pst_tmp_##var = (expr);                                         \
    if (!_pst_tmp_##var.ok())                                             \
        return std::move(_pst_tmp_##var).error();                         \
    auto var = std::move(_pst_tmp_##var).value()

// PST_TRY_VOID: propagate errors from Result<void> expressions
#define PST_TRY_VOID(expr)                                                \
    do {                                                                  \
        auto _pst_tmp = (expr);                                           \
        if (!_pst_tmp.ok()) return std::move(_pst_tmp).error();           \
    } while (false)

} // namespace core
