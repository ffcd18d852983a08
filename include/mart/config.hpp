// mart - Marketplace Configuration
// Builder-style settings, loadable from JSON

#pragma once

#include <mart/guard.hpp>
#include <mart/royalty.hpp>
#include <mart/types.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mart {

// Malformed or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Settings for the reference royalty registry
struct RoyaltySettings {
    uint32_t fee_denominator = royalty::DEFAULT_FEE_DENOMINATOR;
    std::optional<Address> default_receiver;
    uint32_t default_fee = 0;

    // Installs the default royalty, if any. Returns the registry status.
    int32_t apply(RoyaltyRegistry& registry) const;
};

class MarketConfig {
public:
    Address market_address = addresses::MARKETPLACE;
    std::string log_level = "info";
    GuardScope guard_scope = GuardScope::GLOBAL;
    bool explicit_invalidation = true;  // Clear the listing after transfer if the hook did not
    RoyaltySettings royalty;

    MarketConfig() = default;

    // {
    //   "market_address": "0x...", "log_level": "info",
    //   "guard_scope": "global" | "per_asset", "explicit_invalidation": true,
    //   "royalty": {"fee_denominator": 10000, "default_receiver": "0x...", "default_fee": 500}
    // }
    static MarketConfig from_json(std::string_view content);
    static MarketConfig from_file(std::string_view path);

    MarketConfig& with_market_address(const Address& addr) {
        market_address = addr;
        return *this;
    }

    MarketConfig& with_log_level(std::string_view lvl) {
        log_level = std::string(lvl);
        return *this;
    }

    MarketConfig& with_guard_scope(GuardScope scope) {
        guard_scope = scope;
        return *this;
    }

    MarketConfig& with_explicit_invalidation(bool enabled = true) {
        explicit_invalidation = enabled;
        return *this;
    }

    MarketConfig& with_default_royalty(const Address& receiver, uint32_t fee) {
        royalty.default_receiver = receiver;
        royalty.default_fee = fee;
        return *this;
    }
};

}  // namespace mart
