// =============================================================================
// royalty.cpp - RoyaltyRegistry & RoyaltyCalculator Implementation
// =============================================================================

#include "mart/royalty.hpp"

namespace mart {

// =============================================================================
// RoyaltyRegistry
// =============================================================================

RoyaltyRegistry::RoyaltyRegistry(uint32_t fee_denominator)
    : fee_denominator_(fee_denominator == 0 ? royalty::DEFAULT_FEE_DENOMINATOR : fee_denominator) {}

int32_t RoyaltyRegistry::validate(const Address& receiver, uint32_t fee_numerator) const {
    if (fee_numerator > fee_denominator_) return errors::INVALID_ROYALTY;
    if (addresses::is_zero(receiver)) return errors::INVALID_RECEIVER;
    return errors::OK;
}

int32_t RoyaltyRegistry::set_default_royalty(const Address& receiver, uint32_t fee_numerator) {
    int32_t status = validate(receiver, fee_numerator);
    if (status != errors::OK) return status;

    std::unique_lock lock(mutex_);
    default_ = RoyaltyRate{receiver, fee_numerator, fee_denominator_};
    return errors::OK;
}

void RoyaltyRegistry::delete_default_royalty() {
    std::unique_lock lock(mutex_);
    default_.reset();
}

int32_t RoyaltyRegistry::set_asset_royalty(AssetId asset_id, const Address& receiver,
                                           uint32_t fee_numerator) {
    int32_t status = validate(receiver, fee_numerator);
    if (status != errors::OK) return status;

    std::unique_lock lock(mutex_);
    per_asset_[asset_id] = RoyaltyRate{receiver, fee_numerator, fee_denominator_};
    return errors::OK;
}

void RoyaltyRegistry::reset_asset_royalty(AssetId asset_id) {
    std::unique_lock lock(mutex_);
    per_asset_.erase(asset_id);
}

std::optional<RoyaltyRate> RoyaltyRegistry::royalty_rate(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = per_asset_.find(asset_id);
    if (it != per_asset_.end()) return it->second;
    return default_;
}

// =============================================================================
// RoyaltyCalculator
// =============================================================================

RoyaltyCalculator::RoyaltyCalculator(const IRoyaltyConfig& config) : config_(config) {}

RoyaltyQuote RoyaltyCalculator::compute(AssetId asset_id, Amount sale_price,
                                        Amount historical_price) const {
    auto rate = config_.royalty_rate(asset_id);
    if (!rate || rate->fee_denominator == 0) {
        return RoyaltyQuote{addresses::ZERO, 0};
    }

    Amount basis = taxable_basis(sale_price, historical_price);
    Amount num = rate->fee_numerator;
    Amount den = rate->fee_denominator;

    // floor(basis * num / den) without forming basis * num.
    // A misconfigured external rate must not push proceeds below zero.
    Amount quotient = basis / den;
    if (num != 0 && quotient > sale_price / num) {
        return RoyaltyQuote{rate->receiver, sale_price};
    }
    Amount amount = quotient * num;
    Amount remainder = basis % den * num / den;
    if (remainder > sale_price - amount) {
        return RoyaltyQuote{rate->receiver, sale_price};
    }
    amount += remainder;

    return RoyaltyQuote{rate->receiver, amount};
}

} // namespace mart
