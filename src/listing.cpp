// =============================================================================
// listing.cpp - ListingRegistry Implementation
// =============================================================================

#include "mart/listing.hpp"
#include "mart/log.hpp"

namespace mart {

ListingRegistry::ListingRegistry(const IOwnershipLedger& ledger, EventLog& events, Clock clock)
    : ledger_(ledger)
    , events_(events)
    , clock_(clock ? std::move(clock) : Clock(system_now)) {}

// =============================================================================
// Mutations
// =============================================================================

int32_t ListingRegistry::set_listing(AssetId asset_id, Amount sale_price, Timestamp expires_at,
                                     const Currency& currency, Amount historical_price,
                                     const Address& caller) {
    if (sale_price == 0) {
        return errors::SALE_PRICE_CANNOT_BE_ZERO;
    }
    if (expires_at < now()) {
        return errors::INVALID_EXPIRES_TIMESTAMP;
    }
    if (!ledger_.is_approved_or_owner(caller, asset_id)) {
        return errors::CALLER_NOT_OWNER_NOR_APPROVED;
    }

    auto owner = ledger_.owner_of(asset_id);
    if (!owner) {
        return errors::ASSET_NOT_FOUND;
    }

    {
        std::unique_lock lock(mutex_);
        listings_[asset_id] = Listing{sale_price, expires_at, currency, historical_price};
    }

    MART_LOG(info) << "asset " << asset_id << " listed at " << amounts::to_string(sale_price)
                   << " in " << addresses::to_hex(currency.addr) << " until " << expires_at;

    events_.emit(ListingUpdated{asset_id, *owner, sale_price, expires_at, currency,
                                historical_price});
    return errors::OK;
}

int32_t ListingRegistry::remove_listing(AssetId asset_id, const Address& caller) {
    if (!ledger_.is_approved_or_owner(caller, asset_id)) {
        return errors::CALLER_NOT_OWNER_NOR_APPROVED;
    }
    if (!is_active(asset_id)) {
        return errors::INVALID_LISTING;
    }

    invalidate(asset_id);
    return errors::OK;
}

void ListingRegistry::invalidate(AssetId asset_id) {
    {
        std::unique_lock lock(mutex_);
        listings_.erase(asset_id);
    }

    MART_LOG(info) << "asset " << asset_id << " listing cleared";
    events_.emit(ListingUpdated::cleared(asset_id));
}

bool ListingRegistry::erase(AssetId asset_id) {
    std::unique_lock lock(mutex_);
    return listings_.erase(asset_id) > 0;
}

// =============================================================================
// Queries
// =============================================================================

bool ListingRegistry::is_active(AssetId asset_id) const {
    Timestamp t = now();
    std::shared_lock lock(mutex_);
    auto it = listings_.find(asset_id);
    return it != listings_.end() && it->second.is_active(t);
}

Listing ListingRegistry::get(AssetId asset_id) const {
    Timestamp t = now();
    std::shared_lock lock(mutex_);
    auto it = listings_.find(asset_id);
    if (it == listings_.end() || !it->second.is_active(t)) return Listing::none();
    return it->second;
}

std::optional<Listing> ListingRegistry::find(AssetId asset_id) const {
    std::shared_lock lock(mutex_);
    auto it = listings_.find(asset_id);
    if (it == listings_.end()) return std::nullopt;
    return it->second;
}

size_t ListingRegistry::size() const {
    std::shared_lock lock(mutex_);
    return listings_.size();
}

} // namespace mart
