// =============================================================================
// market.cpp - PurchaseCoordinator, TransferHook & Marketplace
// =============================================================================

#include "mart/market.hpp"
#include "mart/log.hpp"

namespace mart {

// =============================================================================
// TransferHook
// =============================================================================

void TransferHook::before_transfer(const Address& from, const Address& to, AssetId asset_id) {
    invocations_.fetch_add(1, std::memory_order_relaxed);

    if (registry_.is_active(asset_id)) {
        MART_LOG(debug) << "asset " << asset_id << " moving " << addresses::to_hex(from)
                        << " -> " << addresses::to_hex(to) << ", cancelling listing";
        registry_.invalidate(asset_id);
    } else if (registry_.erase(asset_id)) {
        MART_LOG(debug) << "asset " << asset_id << " dropped expired listing on transfer";
    }
}

// =============================================================================
// PurchaseCoordinator
// =============================================================================

PurchaseCoordinator::PurchaseCoordinator(ListingRegistry& registry,
                                         const RoyaltyCalculator& royalties,
                                         PaymentProcessor& payments,
                                         IOwnershipLedger& ledger,
                                         EventLog& events,
                                         GuardScope guard_scope,
                                         bool explicit_invalidation)
    : registry_(registry)
    , royalties_(royalties)
    , payments_(payments)
    , ledger_(ledger)
    , events_(events)
    , guard_(guard_scope)
    , explicit_invalidation_(explicit_invalidation) {}

int32_t PurchaseCoordinator::list(const Address& caller, AssetId asset_id, Amount sale_price,
                                  Timestamp expires_at, const Currency& currency,
                                  Amount historical_price) {
    auto scope = guard_.enter(asset_id);
    if (!scope) {
        MART_LOG(debug) << "list asset " << asset_id << " rejected: reentrant call";
        return errors::REENTRANCY;
    }

    int32_t status = registry_.set_listing(asset_id, sale_price, expires_at, currency,
                                           historical_price, caller);
    if (status != errors::OK) {
        MART_LOG(debug) << "list asset " << asset_id << " rejected: " << errors::name(status);
    }
    return status;
}

int32_t PurchaseCoordinator::delist(const Address& caller, AssetId asset_id) {
    auto scope = guard_.enter(asset_id);
    if (!scope) {
        MART_LOG(debug) << "delist asset " << asset_id << " rejected: reentrant call";
        return errors::REENTRANCY;
    }

    int32_t status = registry_.remove_listing(asset_id, caller);
    if (status != errors::OK) {
        MART_LOG(debug) << "delist asset " << asset_id << " rejected: " << errors::name(status);
    }
    return status;
}

int32_t PurchaseCoordinator::buy(const Address& buyer, AssetId asset_id,
                                 Amount expected_sale_price, const Currency& expected_currency,
                                 Amount attached_value) {
    // Held until the transfer and invalidation complete
    auto scope = guard_.enter(asset_id);
    if (!scope) {
        MART_LOG(debug) << "buy asset " << asset_id << " rejected: reentrant call";
        return errors::REENTRANCY;
    }

    auto owner = ledger_.owner_of(asset_id);
    Listing listing = registry_.find(asset_id).value_or(Listing::none());

    // Terms the buyer committed to must match what is stored now
    if (expected_sale_price != listing.sale_price) {
        MART_LOG(debug) << "buy asset " << asset_id << " rejected: sale price changed";
        return errors::INCONSISTENT_SALE_PRICE;
    }
    if (expected_currency != listing.currency) {
        MART_LOG(debug) << "buy asset " << asset_id << " rejected: currency changed";
        return errors::INCONSISTENT_TOKENS;
    }
    if (!registry_.is_active(asset_id) || !owner) {
        MART_LOG(debug) << "buy asset " << asset_id << " rejected: not for sale";
        return errors::INVALID_LISTING;
    }

    RoyaltyQuote quote = royalties_.compute(asset_id, listing.sale_price,
                                            listing.historical_price);

    int32_t status = settle(buyer, *owner, asset_id, listing, quote, attached_value);
    if (status != errors::OK) {
        MART_LOG(debug) << "buy asset " << asset_id << " failed: " << errors::name(status);
        return status;
    }

    MART_LOG(info) << "asset " << asset_id << " sold " << addresses::to_hex(*owner) << " -> "
                   << addresses::to_hex(buyer) << " for " << amounts::to_string(listing.sale_price)
                   << " (royalty " << amounts::to_string(quote.amount) << ")";

    events_.emit(Purchased{asset_id, *owner, buyer, listing.sale_price, listing.currency,
                           quote.amount});
    return errors::OK;
}

int32_t PurchaseCoordinator::settle(const Address& buyer, const Address& seller, AssetId asset_id,
                                    const Listing& listing, const RoyaltyQuote& quote,
                                    Amount attached_value) {
    const Currency& currency = listing.currency;
    Amount proceeds = listing.sale_price - quote.amount;

    if (currency.is_native()) {
        // No change-making, no partial payment
        if (attached_value != listing.sale_price) {
            return errors::INCORRECT_VALUE_SENT;
        }
    } else {
        if (!payments_.supports(currency)) {
            return errors::UNSUPPORTED_CURRENCY;
        }
        if (payments_.allowance(currency, buyer) < listing.sale_price) {
            return errors::INSUFFICIENT_ALLOWANCE;
        }
    }

    // Reverted on every early return below
    PaymentBatch batch(payments_);

    int32_t status = batch.pay(quote.amount, buyer, quote.recipient, currency);
    if (status != errors::OK) return status;

    status = batch.pay(proceeds, buyer, seller, currency);
    if (status != errors::OK) return status;

    status = ledger_.transfer(seller, buyer, asset_id);
    if (status != errors::OK) {
        MART_LOG(warning) << "asset " << asset_id << " transfer refused ("
                          << errors::name(status) << "), reverting payments";
        return errors::OWNERSHIP_TRANSFER_FAILED;
    }

    batch.commit();

    // Ledgers without hook support leave the record behind
    if (explicit_invalidation_ && registry_.find(asset_id)) {
        registry_.invalidate(asset_id);
    }
    return errors::OK;
}

// =============================================================================
// Marketplace
// =============================================================================

Marketplace::Marketplace(IOwnershipLedger& ledger,
                         const IRoyaltyConfig& royalty_config,
                         ICurrencyRail& native,
                         const MarketConfig& config,
                         Clock clock)
    : ledger_(ledger)
    , config_(config)
    , registry_(std::make_unique<ListingRegistry>(ledger, events_, std::move(clock)))
    , royalties_(std::make_unique<RoyaltyCalculator>(royalty_config))
    , payments_(std::make_unique<PaymentProcessor>(native, config.market_address))
    , hook_(std::make_unique<TransferHook>(*registry_)) {

    coordinator_ = std::make_unique<PurchaseCoordinator>(
        *registry_, *royalties_, *payments_, ledger_, events_,
        config_.guard_scope, config_.explicit_invalidation);

    hook_registered_ = ledger_.set_transfer_hook(hook_.get());
    if (!hook_registered_ && !config_.explicit_invalidation) {
        MART_LOG(warning) << "ledger does not call transfer hooks and explicit invalidation "
                             "is disabled; listings may outlive ownership changes";
    }
}

Marketplace::~Marketplace() {
    if (hook_registered_) {
        ledger_.set_transfer_hook(nullptr);
    }
}

int32_t Marketplace::list_item(const Address& caller, AssetId asset_id, Amount sale_price,
                               Timestamp expires_at, const Currency& currency) {
    return list_item(caller, asset_id, sale_price, expires_at, currency, 0);
}

int32_t Marketplace::list_item(const Address& caller, AssetId asset_id, Amount sale_price,
                               Timestamp expires_at, const Currency& currency,
                               Amount historical_price) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return coordinator_->list(caller, asset_id, sale_price, expires_at, currency,
                              historical_price);
}

int32_t Marketplace::delist_item(const Address& caller, AssetId asset_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return coordinator_->delist(caller, asset_id);
}

int32_t Marketplace::buy_item(const Address& buyer, AssetId asset_id, Amount expected_sale_price,
                              const Currency& expected_currency, Amount attached_value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return coordinator_->buy(buyer, asset_id, expected_sale_price, expected_currency,
                             attached_value);
}

Listing Marketplace::get_listing(AssetId asset_id) const {
    return coordinator_->get_listing(asset_id);
}

void Marketplace::register_token(const Currency& token, ICurrencyRail* rail) {
    payments_->register_token(token, rail);
}

} // namespace mart
