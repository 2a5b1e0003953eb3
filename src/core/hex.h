#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string to bytes. An optional "0x"/"0X" prefix is
// accepted. Returns nullopt on odd length or non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Even length and every character in [0-9a-fA-F] (prefix not allowed).
bool is_hex(std::string_view str);

// Value of one hex digit, or -1.
int hex_digit_value(char c) noexcept;

}  // namespace core
