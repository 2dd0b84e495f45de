#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace jaegerprop::hex {

// Value of a single hex digit, or -1. Both cases are accepted.
[[nodiscard]] inline constexpr int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Offset of the first non-hex character, or nullopt if every character is a hex digit
[[nodiscard]] inline std::optional<size_t> find_invalid_digit(std::string_view s) noexcept {
    for (size_t i = 0; i < s.size(); ++i) {
        if (digit_value(s[i]) < 0) return i;
    }
    return std::nullopt;
}

[[nodiscard]] inline bool is_valid_hex(std::string_view s) noexcept {
    return !find_invalid_digit(s).has_value();
}

/// Append the lowercase rendering of bytes to out, most significant first
inline void encode(std::span<const uint8_t> bytes, std::string& out) {
    static constexpr char kDigits[] = "0123456789abcdef";
    out.reserve(out.size() + bytes.size() * 2);
    for (const uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0F];
    }
}

[[nodiscard]] inline std::string encode(std::span<const uint8_t> bytes) {
    std::string out;
    encode(bytes, out);
    return out;
}

/**
 * @brief Decode exactly out.size() bytes from a hex string of twice that length.
 *
 * Each character pair becomes one byte, first pair into out[0].
 * @return false if the length does not match or a non-hex character is found;
 *         out is left partially written in that case.
 */
[[nodiscard]] inline bool decode(std::string_view hex, std::span<uint8_t> out) noexcept {
    if (hex.size() != out.size() * 2) return false;
    for (size_t i = 0; i < out.size(); ++i) {
        const int hi = digit_value(hex[2 * i]);
        const int lo = digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace jaegerprop::hex
