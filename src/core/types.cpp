#include "core/types.h"
#include "core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace core {

// ===========================================================================
// Blob<N>
// ===========================================================================

// Definitions live here; explicit instantiations for N=32 and N=20 below.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != N * 2) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(N * 2) +
            " hex chars, got " + std::to_string(hex.size()));
    }

    Blob<N> result;
    for (std::size_t i = 0; i < N; ++i) {
        int hi = hex_digit_value(hex[2 * i]);
        int lo = hex_digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument(
                "Blob::from_hex: invalid hex character");
        }
        result.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    return core::to_hex(std::span<const uint8_t>(bytes_.data(), N));
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template class Blob<32>;
template class Blob<20>;

// ===========================================================================
// uint256 / uint160 factories
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_hex(hex);
    return result;
}

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes(bytes);
    return result;
}

uint160 uint160::from_hex(std::string_view hex) {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_hex(hex);
    return result;
}

uint160 uint160::from_bytes(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes(bytes);
    return result;
}

namespace {

// FNV-1a; hash-table distribution only.
template <std::size_t N>
std::size_t fnv1a(const std::array<uint8_t, N>& b) noexcept {
    std::size_t h = 14695981039346656037ULL;
    for (auto byte : b) {
        h ^= static_cast<std::size_t>(byte);
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    return core::fnv1a(v.bytes());
}

std::size_t std::hash<core::uint160>::operator()(
    const core::uint160& v) const noexcept {
    return core::fnv1a(v.bytes());
}
