#include "core/hex.h"

#include <array>

namespace core {

namespace {

constexpr char LOWER_DIGITS[] = "0123456789abcdef";

std::string_view strip_prefix(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

}  // namespace

int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(LOWER_DIGITS[byte >> 4]);
        result.push_back(LOWER_DIGITS[byte & 0x0F]);
    }
    return result;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    hex = strip_prefix(hex);
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit_value(hex[i]);
        int lo = hex_digit_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_hex(std::string_view str) {
    if (str.empty() || str.size() % 2 != 0) return false;
    for (char c : str) {
        if (hex_digit_value(c) < 0) return false;
    }
    return true;
}

}  // namespace core
