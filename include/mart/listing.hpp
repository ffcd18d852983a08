#ifndef MART_LISTING_HPP
#define MART_LISTING_HPP

#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <optional>

#include "types.hpp"
#include "events.hpp"
#include "ledger.hpp"

namespace mart {

// =============================================================================
// Listing
// =============================================================================

struct Listing {
    Amount sale_price;
    Timestamp expires_at;
    Currency currency;
    Amount historical_price;  // Royalty-exempt baseline

    bool is_active(Timestamp now) const {
        return sale_price > 0 && expires_at >= now;
    }

    // All-zero view returned for assets that are not for sale
    static Listing none() { return Listing{0, 0, NATIVE, 0}; }

    bool operator==(const Listing& other) const {
        return sale_price == other.sale_price && expires_at == other.expires_at &&
               currency == other.currency && historical_price == other.historical_price;
    }
    bool operator!=(const Listing& other) const { return !(*this == other); }
};

// =============================================================================
// ListingRegistry - Single Current Listing per Asset
// =============================================================================

class ListingRegistry {
public:
    ListingRegistry(const IOwnershipLedger& ledger, EventLog& events, Clock clock);
    ~ListingRegistry() = default;

    // Non-copyable
    ListingRegistry(const ListingRegistry&) = delete;
    ListingRegistry& operator=(const ListingRegistry&) = delete;

    // =========================================================================
    // Mutations
    // =========================================================================

    // Replaces any previous record. Checks price, then expiry, then caller.
    int32_t set_listing(AssetId asset_id, Amount sale_price, Timestamp expires_at,
                        const Currency& currency, Amount historical_price,
                        const Address& caller);

    // Caller must be authorized and the listing active
    int32_t remove_listing(AssetId asset_id, const Address& caller);

    // Unconditional reset; always emits the cleared event
    void invalidate(AssetId asset_id);

    // Drops the stored record without an event. Returns whether one existed.
    bool erase(AssetId asset_id);

    // =========================================================================
    // Queries
    // =========================================================================

    bool is_active(AssetId asset_id) const;

    // Active listing, or Listing::none()
    Listing get(AssetId asset_id) const;

    // Stored record regardless of expiry
    std::optional<Listing> find(AssetId asset_id) const;

    size_t size() const;

    Timestamp now() const { return clock_(); }

private:
    const IOwnershipLedger& ledger_;
    EventLog& events_;
    Clock clock_;

    std::unordered_map<AssetId, Listing> listings_;
    mutable std::shared_mutex mutex_;
};

} // namespace mart

#endif // MART_LISTING_HPP
