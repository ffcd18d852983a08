#ifndef MART_ROYALTY_HPP
#define MART_ROYALTY_HPP

#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <optional>

#include "types.hpp"

namespace mart {

// =============================================================================
// Royalty Rate
// =============================================================================

// Rate = fee_numerator / fee_denominator (denominator 10000 = basis points)
struct RoyaltyRate {
    Address receiver;
    uint32_t fee_numerator;
    uint32_t fee_denominator;
};

namespace royalty {
constexpr uint32_t DEFAULT_FEE_DENOMINATOR = 10000;
}

// =============================================================================
// Royalty Configuration Interface
// =============================================================================

class IRoyaltyConfig {
public:
    virtual ~IRoyaltyConfig() = default;

    // nullopt when no royalty applies to the asset
    virtual std::optional<RoyaltyRate> royalty_rate(AssetId asset_id) const = 0;
};

// =============================================================================
// RoyaltyRegistry - In-memory Default + Per-asset Royalties
// =============================================================================

class RoyaltyRegistry : public IRoyaltyConfig {
public:
    explicit RoyaltyRegistry(uint32_t fee_denominator = royalty::DEFAULT_FEE_DENOMINATOR);
    ~RoyaltyRegistry() override = default;

    // Non-copyable
    RoyaltyRegistry(const RoyaltyRegistry&) = delete;
    RoyaltyRegistry& operator=(const RoyaltyRegistry&) = delete;

    uint32_t fee_denominator() const { return fee_denominator_; }

    int32_t set_default_royalty(const Address& receiver, uint32_t fee_numerator);
    void delete_default_royalty();

    int32_t set_asset_royalty(AssetId asset_id, const Address& receiver, uint32_t fee_numerator);
    void reset_asset_royalty(AssetId asset_id);

    // Per-asset setting, falling back to the default
    std::optional<RoyaltyRate> royalty_rate(AssetId asset_id) const override;

private:
    uint32_t fee_denominator_;
    std::optional<RoyaltyRate> default_;
    std::unordered_map<AssetId, RoyaltyRate> per_asset_;
    mutable std::shared_mutex mutex_;

    int32_t validate(const Address& receiver, uint32_t fee_numerator) const;
};

// =============================================================================
// RoyaltyCalculator - Value-added Royalties
// =============================================================================

struct RoyaltyQuote {
    Address recipient;
    Amount amount;
};

class RoyaltyCalculator {
public:
    explicit RoyaltyCalculator(const IRoyaltyConfig& config);

    // Royalty applies to max(0, sale_price - historical_price) only.
    // The recipient is reported even when the amount is zero.
    RoyaltyQuote compute(AssetId asset_id, Amount sale_price, Amount historical_price) const;

    static Amount taxable_basis(Amount sale_price, Amount historical_price) {
        return historical_price >= sale_price ? 0 : sale_price - historical_price;
    }

private:
    const IRoyaltyConfig& config_;
};

} // namespace mart

#endif // MART_ROYALTY_HPP
