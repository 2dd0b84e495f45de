#pragma once

#include "core/hex.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jaegerprop {

/**
 * @brief Fixed-width binary identifier rendered as big-endian lowercase hex
 *
 * Tag makes TraceId and SpanId distinct types even where the width matches.
 * Immutable once constructed; the default value is all zeros.
 */
template<size_t kSize, typename Tag>
class Identifier {
public:
    using Bytes = std::array<uint8_t, kSize>;

    static constexpr size_t kByteLength = kSize;
    static constexpr size_t kHexLength = kSize * 2;

    constexpr Identifier() = default;
    explicit constexpr Identifier(const Bytes& bytes) : bytes_(bytes) {}

    [[nodiscard]] constexpr const Bytes& bytes() const { return bytes_; }

    [[nodiscard]] constexpr bool is_zero() const {
        return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
    }

    /// kHexLength lowercase hex characters
    [[nodiscard]] std::string to_hex() const { return hex::encode(bytes_); }

    /// Strict decode: exactly kHexLength hex digits, no padding
    [[nodiscard]] static std::optional<Identifier> from_hex(std::string_view hex_str) {
        Bytes bytes{};
        if (!hex::decode(hex_str, bytes)) return std::nullopt;
        return Identifier(bytes);
    }

    friend constexpr bool operator==(const Identifier&, const Identifier&) = default;

private:
    Bytes bytes_{};
};

struct TraceIdTag {};
struct SpanIdTag {};

using TraceId = Identifier<16, TraceIdTag>;  // 128-bit, 32 hex chars
using SpanId = Identifier<8, SpanIdTag>;     // 64-bit, 16 hex chars

// ============================================================================
// Trace Flags
// ============================================================================

/**
 * @brief Trace flag bitset. Only SAMPLED is read or written by the Jaeger codec.
 */
struct TraceFlags {
    static constexpr uint8_t kNone = 0x00;
    static constexpr uint8_t kSampled = 0x01;

    uint8_t value = kNone;

    [[nodiscard]] constexpr bool is_sampled() const { return (value & kSampled) != 0; }

    [[nodiscard]] static constexpr TraceFlags sampled() { return TraceFlags{kSampled}; }
    [[nodiscard]] static constexpr TraceFlags none() { return TraceFlags{kNone}; }

    friend constexpr bool operator==(const TraceFlags&, const TraceFlags&) = default;
};

} // namespace jaegerprop
