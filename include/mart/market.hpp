#ifndef MART_MARKET_HPP
#define MART_MARKET_HPP

// =============================================================================
// mart - No-Intermediary Asset Marketplace
//
//   ListingRegistry     single current listing per asset
//   RoyaltyCalculator   value-added royalty quotes
//   PaymentProcessor    native / token payment legs
//   PurchaseCoordinator list, delist, buy under a reentrancy guard
//   TransferHook        clears listings before any change of owner
//
// =============================================================================

#include <atomic>
#include <memory>
#include <mutex>

#include "types.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "listing.hpp"
#include "royalty.hpp"
#include "payment.hpp"
#include "guard.hpp"
#include "config.hpp"

namespace mart {

// =============================================================================
// TransferHook
// =============================================================================

class TransferHook : public ITransferHook {
public:
    explicit TransferHook(ListingRegistry& registry) : registry_(registry) {}

    // Active listing -> invalidated (cleared event). Expired record -> dropped silently.
    void before_transfer(const Address& from, const Address& to, AssetId asset_id) override;

    uint64_t invocations() const { return invocations_.load(std::memory_order_relaxed); }

private:
    ListingRegistry& registry_;
    std::atomic<uint64_t> invocations_{0};
};

// =============================================================================
// PurchaseCoordinator
// =============================================================================

class PurchaseCoordinator {
public:
    PurchaseCoordinator(ListingRegistry& registry,
                        const RoyaltyCalculator& royalties,
                        PaymentProcessor& payments,
                        IOwnershipLedger& ledger,
                        EventLog& events,
                        GuardScope guard_scope = GuardScope::GLOBAL,
                        bool explicit_invalidation = true);

    // Non-copyable
    PurchaseCoordinator(const PurchaseCoordinator&) = delete;
    PurchaseCoordinator& operator=(const PurchaseCoordinator&) = delete;

    int32_t list(const Address& caller, AssetId asset_id, Amount sale_price,
                 Timestamp expires_at, const Currency& currency, Amount historical_price = 0);

    int32_t delist(const Address& caller, AssetId asset_id);

    // attached_value is only checked for native-currency listings
    int32_t buy(const Address& buyer, AssetId asset_id, Amount expected_sale_price,
                const Currency& expected_currency, Amount attached_value);

    Listing get_listing(AssetId asset_id) const { return registry_.get(asset_id); }

    const ReentrancyGuard& guard() const { return guard_; }

private:
    ListingRegistry& registry_;
    const RoyaltyCalculator& royalties_;
    PaymentProcessor& payments_;
    IOwnershipLedger& ledger_;
    EventLog& events_;
    ReentrancyGuard guard_;
    bool explicit_invalidation_;

    int32_t settle(const Address& buyer, const Address& seller, AssetId asset_id,
                   const Listing& listing, const RoyaltyQuote& quote, Amount attached_value);
};

// =============================================================================
// Marketplace - Wires Components to External Collaborators
// =============================================================================

class Marketplace {
public:
    // Registers the transfer hook with `ledger`; unregisters on destruction.
    // `clock` defaults to the system clock.
    Marketplace(IOwnershipLedger& ledger,
                const IRoyaltyConfig& royalty_config,
                ICurrencyRail& native,
                const MarketConfig& config = MarketConfig(),
                Clock clock = Clock());
    ~Marketplace();

    // Non-copyable
    Marketplace(const Marketplace&) = delete;
    Marketplace& operator=(const Marketplace&) = delete;

    // =========================================================================
    // Protocol Surface
    // =========================================================================

    int32_t list_item(const Address& caller, AssetId asset_id, Amount sale_price,
                      Timestamp expires_at, const Currency& currency);

    int32_t list_item(const Address& caller, AssetId asset_id, Amount sale_price,
                      Timestamp expires_at, const Currency& currency, Amount historical_price);

    int32_t delist_item(const Address& caller, AssetId asset_id);

    int32_t buy_item(const Address& buyer, AssetId asset_id, Amount expected_sale_price,
                     const Currency& expected_currency, Amount attached_value = 0);

    // Zeroed when the asset is not for sale
    Listing get_listing(AssetId asset_id) const;

    // =========================================================================
    // Setup & Access
    // =========================================================================

    void register_token(const Currency& token, ICurrencyRail* rail);

    EventLog& events() { return events_; }
    const EventLog& events() const { return events_; }

    ListingRegistry& registry() { return *registry_; }
    const ListingRegistry& registry() const { return *registry_; }

    const TransferHook& hook() const { return *hook_; }
    const MarketConfig& config() const { return config_; }
    const Address& address() const { return config_.market_address; }

    bool hook_registered() const { return hook_registered_; }

private:
    IOwnershipLedger& ledger_;
    MarketConfig config_;

    EventLog events_;
    std::unique_ptr<ListingRegistry> registry_;
    std::unique_ptr<RoyaltyCalculator> royalties_;
    std::unique_ptr<PaymentProcessor> payments_;
    std::unique_ptr<TransferHook> hook_;
    std::unique_ptr<PurchaseCoordinator> coordinator_;
    bool hook_registered_{false};

    // Serializes callers from different threads; same-thread reentry
    // falls through to the coordinator's guard
    mutable std::recursive_mutex mutex_;
};

} // namespace mart

#endif // MART_MARKET_HPP
