#pragma once

#include "tracing/carrier.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jaegerprop::testing {

/**
 * @brief Ordered metadata list, like message-queue headers (duplicates allowed)
 */
struct MockMetadata {
    std::vector<std::pair<std::string, std::string>> entries;
};

class MockInjector {
public:
    void inject(std::string value, std::string_view key, MockMetadata& carrier) const {
        ++inject_count_;
        carrier.entries.emplace_back(std::string(key), std::move(value));
    }

    [[nodiscard]] int inject_count() const { return inject_count_; }

private:
    mutable int inject_count_ = 0;
};

/**
 * @brief Returns the first entry with the key; records which keys were asked for
 */
class MockExtractor {
public:
    [[nodiscard]] std::optional<std::string> extract(std::string_view key,
                                                     const MockMetadata& carrier) const {
        requested_keys_.emplace_back(key);
        for (const auto& [name, value] : carrier.entries) {
            if (name == key) return value;
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::vector<std::string>& requested_keys() const { return requested_keys_; }

private:
    mutable std::vector<std::string> requested_keys_;
};

static_assert(Injector<MockInjector, MockMetadata>);
static_assert(Extractor<MockExtractor, MockMetadata>);

} // namespace jaegerprop::testing
