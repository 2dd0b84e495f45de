#pragma once

#include "core/utils.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace jaegerprop {

// ============================================================================
// Carrier Capabilities
// ============================================================================

/**
 * @brief Sets a named string header on a caller-owned carrier
 *
 * Usage:
 *   struct GrpcMetadataInjector {
 *       void inject(std::string value, std::string_view key, grpc::ClientContext& ctx) const;
 *   };
 */
template<typename I, typename Carrier>
concept Injector = requires(const I& injector, std::string value, std::string_view key,
                            Carrier& carrier) {
    injector.inject(std::move(value), key, carrier);
};

/**
 * @brief Reads a named string header from a caller-owned carrier
 *
 * Returns nullopt when the header is not present.
 */
template<typename E, typename Carrier>
concept Extractor = requires(const E& extractor, std::string_view key, const Carrier& carrier) {
    { extractor.extract(key, carrier) } -> std::convertible_to<std::optional<std::string>>;
};

// ============================================================================
// Map-backed carrier (HTTP-style header maps, test doubles)
// ============================================================================

using HeaderMap = std::unordered_map<std::string, std::string>;

struct MapInjector {
    void inject(std::string value, std::string_view key, HeaderMap& carrier) const {
        carrier.insert_or_assign(std::string(key), std::move(value));
    }
};

/**
 * @brief Looks the key up exactly, then case-insensitively (HTTP header names)
 *
 * When several names differ from key only in case, the value under the
 * bytewise-smallest name wins, independent of map iteration order.
 */
struct MapExtractor {
    [[nodiscard]] std::optional<std::string> extract(std::string_view key,
                                                     const HeaderMap& carrier) const {
        if (const auto it = carrier.find(std::string(key)); it != carrier.end()) {
            return it->second;
        }
        const std::string lower_key = utils::to_lower(key);
        const HeaderMap::value_type* match = nullptr;
        for (const auto& entry : carrier) {
            if (utils::to_lower(entry.first) != lower_key) continue;
            if (!match || entry.first < match->first) {
                match = &entry;
            }
        }
        if (!match) return std::nullopt;
        return match->second;
    }
};

static_assert(Injector<MapInjector, HeaderMap>);
static_assert(Extractor<MapExtractor, HeaderMap>);

} // namespace jaegerprop
