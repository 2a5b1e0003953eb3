#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size opaque byte array
// ---------------------------------------------------------------------------
// Bytes are kept in display order: data()[0] is the first byte of the hex
// form, so an account id prints exactly as it was entered.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parses exactly 2*N hex chars, optional "0x" prefix.
    /// Throws std::invalid_argument on malformed input.
    static Blob from_hex(std::string_view hex);

    /// 2*N lower-case hex chars, no prefix.
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept {
        return bytes_ <=> other.bytes_;
    }
    [[nodiscard]] bool operator==(const Blob& other) const noexcept {
        return bytes_ == other.bytes_;
    }

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 32-byte value (digests, salts)
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    static uint256 from_hex(std::string_view hex);
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
};

// ---------------------------------------------------------------------------
// uint160 -- 20-byte value (account and asset identifiers)
// ---------------------------------------------------------------------------
class uint160 : public Blob<20> {
public:
    using Blob<20>::Blob;

    static uint160 from_hex(std::string_view hex);
    static uint160 from_bytes(std::span<const uint8_t, 20> bytes) noexcept;
};

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};

template <>
struct std::hash<core::uint160> {
    std::size_t operator()(const core::uint160& v) const noexcept;
};
