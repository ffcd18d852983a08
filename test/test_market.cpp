// mart - Marketplace Tests

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <mart/market.hpp>

#include <functional>
#include <thread>
#include <vector>

using namespace mart;
using namespace mart::testing;

namespace {

// Runs `action` when paid, then accepts or refuses the payment
struct ScriptedReceiver : IPaymentReceiver {
    std::function<int32_t()> action;
    std::vector<int32_t> results;
    bool accept = true;

    bool on_receive(const Currency&, const Address&, Amount) override {
        if (action) results.push_back(action());
        return accept;
    }
};

// Ledger that cannot call transfer hooks
struct HooklessLedger : IOwnershipLedger {
    AssetLedger& inner;
    bool refuse_transfers = false;

    explicit HooklessLedger(AssetLedger& ledger) : inner(ledger) {}

    std::optional<Address> owner_of(AssetId asset_id) const override {
        return inner.owner_of(asset_id);
    }
    bool is_approved_or_owner(const Address& spender, AssetId asset_id) const override {
        return inner.is_approved_or_owner(spender, asset_id);
    }
    int32_t transfer(const Address& from, const Address& to, AssetId asset_id) override {
        if (refuse_transfers) return errors::OWNERSHIP_TRANSFER_FAILED;
        return inner.transfer(from, to, asset_id);
    }
    bool set_transfer_hook(ITransferHook*) override { return false; }
};

}  // namespace

// =============================================================================
// Purchase
// =============================================================================

TEST_CASE("Marketplace native purchase with royalty", "[market]") {
    MarketFixture f;
    REQUIRE(f.royalties.set_default_royalty(CREATOR, 1000) == errors::OK);  // 10%
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 100);

    REQUIRE(f.market->get_listing(1) == Listing{100, f.now + 1000, NATIVE, 0});

    REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);

    REQUIRE(f.bank.balance_of(CREATOR) == 10);
    REQUIRE(f.bank.balance_of(ALICE) == 90);
    REQUIRE(f.bank.balance_of(BOB) == 0);
    REQUIRE(f.assets.owner_of(1) == BOB);
    REQUIRE(f.market->get_listing(1) == Listing::none());

    auto events = f.market->events().events();
    REQUIRE(events.size() == 3);
    REQUIRE(std::get<ListingUpdated>(events[0]).seller == ALICE);
    REQUIRE(std::get<ListingUpdated>(events[1]).is_cleared());
    REQUIRE(std::get<Purchased>(events[2]) == Purchased{1, ALICE, BOB, 100, NATIVE, 10});

    SECTION("Sold listing cannot be bought again") {
        f.bank.credit(CAROL, 100);
        REQUIRE(f.market->buy_item(CAROL, 1, 100, NATIVE, 100) == errors::INCONSISTENT_SALE_PRICE);
        REQUIRE(f.market->buy_item(CAROL, 1, 0, NATIVE, 0) == errors::INVALID_LISTING);
        REQUIRE(f.assets.owner_of(1) == BOB);
    }

    SECTION("New owner can relist") {
        REQUIRE(f.market->list_item(BOB, 1, 150, f.now + 10, NATIVE, 100) == errors::OK);
        REQUIRE(f.market->get_listing(1).historical_price == 100);
    }
}

TEST_CASE("Marketplace front-running guard", "[market]") {
    MarketFixture f;
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 200);

    SECTION("Price mismatch") {
        REQUIRE(f.market->buy_item(BOB, 1, 95, NATIVE, 95) == errors::INCONSISTENT_SALE_PRICE);
        REQUIRE(f.market->get_listing(1) == Listing{100, f.now + 1000, NATIVE, 0});
        REQUIRE(f.bank.balance_of(BOB) == 200);
        REQUIRE(f.assets.owner_of(1) == ALICE);
    }

    SECTION("Seller raises the price before the buy lands") {
        REQUIRE(f.market->list_item(ALICE, 1, 150, f.now + 1000, NATIVE) == errors::OK);
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::INCONSISTENT_SALE_PRICE);
        REQUIRE(f.bank.balance_of(BOB) == 200);
    }

    SECTION("Currency mismatch") {
        REQUIRE(f.market->buy_item(BOB, 1, 100, Currency{TOKEN}, 0) == errors::INCONSISTENT_TOKENS);
    }

    SECTION("Attached value must match exactly") {
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 99) == errors::INCORRECT_VALUE_SENT);
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 101) == errors::INCORRECT_VALUE_SENT);
        REQUIRE(f.market->get_listing(1).sale_price == 100);
    }
}

TEST_CASE("Marketplace expiry", "[market]") {
    MarketFixture f;
    REQUIRE(f.assets.mint(ALICE, 1) == errors::OK);
    f.bank.credit(BOB, 100);

    SECTION("Past expiry rejected at listing time") {
        REQUIRE(f.market->list_item(ALICE, 1, 50, f.now - 1, NATIVE) ==
                errors::INVALID_EXPIRES_TIMESTAMP);
    }

    SECTION("Expired listing cannot be bought") {
        REQUIRE(f.market->list_item(ALICE, 1, 50, f.now + 10, NATIVE) == errors::OK);
        f.now += 11;

        REQUIRE(f.market->get_listing(1) == Listing::none());
        REQUIRE(f.market->buy_item(BOB, 1, 50, NATIVE, 50) == errors::INVALID_LISTING);
        REQUIRE(f.bank.balance_of(BOB) == 100);
        REQUIRE(f.assets.owner_of(1) == ALICE);
    }

    SECTION("Expiry instant is still buyable") {
        REQUIRE(f.market->list_item(ALICE, 1, 50, f.now + 10, NATIVE) == errors::OK);
        f.now += 10;
        REQUIRE(f.market->buy_item(BOB, 1, 50, NATIVE, 50) == errors::OK);
    }
}

TEST_CASE("Marketplace never-listed asset", "[market]") {
    MarketFixture f;
    REQUIRE(f.assets.mint(ALICE, 1) == errors::OK);

    REQUIRE(f.market->get_listing(1) == Listing::none());
    REQUIRE(f.market->buy_item(BOB, 1, 0, NATIVE, 0) == errors::INVALID_LISTING);
    REQUIRE(f.market->buy_item(BOB, 1, 10, NATIVE, 10) == errors::INCONSISTENT_SALE_PRICE);
    REQUIRE(f.market->delist_item(ALICE, 1) == errors::INVALID_LISTING);
}

TEST_CASE("Marketplace value-added royalty", "[market][royalty]") {
    MarketFixture f;
    REQUIRE(f.royalties.set_asset_royalty(1, CREATOR, 1000) == errors::OK);
    f.bank.credit(BOB, 1000);

    SECTION("Only appreciation is taxed") {
        REQUIRE(f.mint_and_list(1, ALICE, 100, 60) == errors::OK);
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(f.bank.balance_of(CREATOR) == 4);
        REQUIRE(f.bank.balance_of(ALICE) == 96);
        REQUIRE(f.market->events().purchases()[0].royalty_amount == 4);
    }

    SECTION("Sale at a loss pays no royalty") {
        REQUIRE(f.mint_and_list(1, ALICE, 100, 500) == errors::OK);
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(f.bank.balance_of(CREATOR) == 0);
        REQUIRE(f.bank.balance_of(ALICE) == 100);
    }

    SECTION("No royalty configured") {
        REQUIRE(f.mint_and_list(2, ALICE, 100) == errors::OK);
        REQUIRE(f.market->buy_item(BOB, 2, 100, NATIVE, 100) == errors::OK);
        REQUIRE(f.bank.balance_of(ALICE) == 100);
        REQUIRE(f.market->events().purchases()[0].royalty_amount == 0);
    }
}

TEST_CASE("Marketplace token purchase", "[market][token]") {
    MarketFixture f;
    REQUIRE(f.royalties.set_default_royalty(CREATOR, 500) == errors::OK);  // 5%
    REQUIRE(f.assets.mint(ALICE, 1) == errors::OK);
    REQUIRE(f.market->list_item(ALICE, 1, 200, f.now + 100, f.token.currency()) == errors::OK);
    f.token.mint(BOB, 500);

    SECTION("Pays through the allowance") {
        f.token.approve(BOB, addresses::MARKETPLACE, 200);
        REQUIRE(f.market->buy_item(BOB, 1, 200, f.token.currency()) == errors::OK);

        REQUIRE(f.token.balance_of(CREATOR) == 10);
        REQUIRE(f.token.balance_of(ALICE) == 190);
        REQUIRE(f.token.balance_of(BOB) == 300);
        REQUIRE(f.token.allowance(BOB, addresses::MARKETPLACE) == 0);
        REQUIRE(f.assets.owner_of(1) == BOB);
    }

    SECTION("Insufficient allowance") {
        f.token.approve(BOB, addresses::MARKETPLACE, 199);
        REQUIRE(f.market->buy_item(BOB, 1, 200, f.token.currency()) == errors::INSUFFICIENT_ALLOWANCE);
        REQUIRE(f.token.balance_of(BOB) == 500);
        REQUIRE(f.market->get_listing(1).sale_price == 200);
    }

    SECTION("Allowance granted to a different spender does not count") {
        f.token.approve(BOB, CAROL, 200);
        REQUIRE(f.market->buy_item(BOB, 1, 200, f.token.currency()) == errors::INSUFFICIENT_ALLOWANCE);
    }

    SECTION("Allowance without balance fails the payment") {
        f.token.approve(CAROL, addresses::MARKETPLACE, 200);
        REQUIRE(f.market->buy_item(CAROL, 1, 200, f.token.currency()) ==
                errors::PAYMENT_TRANSFER_FAILED);
        REQUIRE(f.token.balance_of(CREATOR) == 0);
        REQUIRE(f.assets.owner_of(1) == ALICE);
    }
}

TEST_CASE("Marketplace unsupported token", "[market][token]") {
    MarketFixture f;
    Currency unknown{addresses::from_u64(0x99)};
    REQUIRE(f.assets.mint(ALICE, 1) == errors::OK);
    REQUIRE(f.market->list_item(ALICE, 1, 10, f.now + 100, unknown) == errors::OK);

    REQUIRE(f.market->buy_item(BOB, 1, 10, unknown) == errors::UNSUPPORTED_CURRENCY);
    REQUIRE(f.assets.owner_of(1) == ALICE);
}

TEST_CASE("Marketplace purchase is all-or-nothing", "[market][atomic]") {
    MarketFixture f;
    REQUIRE(f.royalties.set_default_royalty(CREATOR, 1000) == errors::OK);
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 100);

    SECTION("Seller refuses payment after royalty leg succeeded") {
        ScriptedReceiver seller;
        seller.accept = false;
        f.bank.set_receiver(ALICE, &seller);

        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::PAYMENT_TRANSFER_FAILED);
        REQUIRE(f.bank.balance_of(BOB) == 100);
        REQUIRE(f.bank.balance_of(CREATOR) == 0);
        REQUIRE(f.bank.balance_of(ALICE) == 0);
        REQUIRE(f.assets.owner_of(1) == ALICE);
        REQUIRE(f.market->get_listing(1).sale_price == 100);
        REQUIRE(f.market->events().purchases().empty());
    }

    SECTION("Royalty recipient refuses payment") {
        ScriptedReceiver creator;
        creator.accept = false;
        f.bank.set_receiver(CREATOR, &creator);

        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::PAYMENT_TRANSFER_FAILED);
        REQUIRE(f.bank.balance_of(BOB) == 100);
        REQUIRE(f.assets.owner_of(1) == ALICE);
    }
}

TEST_CASE("Seller moves the asset away during payment", "[market][atomic]") {
    MarketFixture f;
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 100);

    ScriptedReceiver seller;
    seller.action = [&]() { return f.assets.transfer_from(ALICE, ALICE, CAROL, 1); };
    f.bank.set_receiver(ALICE, &seller);

    REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OWNERSHIP_TRANSFER_FAILED);
    REQUIRE(seller.results == std::vector<int32_t>{errors::OK});
    REQUIRE(f.bank.balance_of(BOB) == 100);
    REQUIRE(f.bank.balance_of(ALICE) == 0);
    REQUIRE(f.assets.owner_of(1) == CAROL);
    REQUIRE(f.market->get_listing(1) == Listing::none());
    REQUIRE(f.market->events().purchases().empty());
}

TEST_CASE("Marketplace ownership transfer failure reverts payments", "[market][atomic]") {
    loggers::disable();
    Timestamp now = 1000;
    AssetLedger assets;
    HooklessLedger ledger(assets);
    RoyaltyRegistry royalties;
    NativeBank bank;
    REQUIRE(royalties.set_default_royalty(CREATOR, 1000) == errors::OK);

    Marketplace market(ledger, royalties, bank, MarketConfig(), [&now]() { return now; });
    REQUIRE(assets.mint(ALICE, 1) == errors::OK);
    REQUIRE(market.list_item(ALICE, 1, 100, now + 10, NATIVE) == errors::OK);
    bank.credit(BOB, 100);

    ledger.refuse_transfers = true;
    REQUIRE(market.buy_item(BOB, 1, 100, NATIVE, 100) == errors::OWNERSHIP_TRANSFER_FAILED);
    REQUIRE(bank.balance_of(BOB) == 100);
    REQUIRE(bank.balance_of(CREATOR) == 0);
    REQUIRE(bank.balance_of(ALICE) == 0);
    REQUIRE(assets.owner_of(1) == ALICE);
    REQUIRE(market.get_listing(1).sale_price == 100);
}

// =============================================================================
// Listing surface
// =============================================================================

TEST_CASE("Marketplace list and delist", "[market]") {
    MarketFixture f;
    REQUIRE(f.assets.mint(ALICE, 1) == errors::OK);

    SECTION("Only owner or approved may list") {
        REQUIRE(f.market->list_item(BOB, 1, 100, f.now + 10, NATIVE) ==
                errors::CALLER_NOT_OWNER_NOR_APPROVED);
        REQUIRE(f.market->list_item(ALICE, 1, 0, f.now + 10, NATIVE) ==
                errors::SALE_PRICE_CANNOT_BE_ZERO);
    }

    SECTION("Approved lister; proceeds go to the owner") {
        REQUIRE(f.assets.approve(ALICE, BOB, 1) == errors::OK);
        REQUIRE(f.market->list_item(BOB, 1, 100, f.now + 10, NATIVE) == errors::OK);
        REQUIRE(f.market->events().listing_updates()[0].seller == ALICE);

        f.bank.credit(CAROL, 100);
        REQUIRE(f.market->buy_item(CAROL, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(f.bank.balance_of(ALICE) == 100);
        REQUIRE(f.bank.balance_of(BOB) == 0);
        REQUIRE(f.market->events().purchases()[0].seller == ALICE);
    }

    SECTION("Delist") {
        REQUIRE(f.market->list_item(ALICE, 1, 100, f.now + 10, NATIVE) == errors::OK);
        REQUIRE(f.market->delist_item(BOB, 1) == errors::CALLER_NOT_OWNER_NOR_APPROVED);
        REQUIRE(f.market->delist_item(ALICE, 1) == errors::OK);
        REQUIRE(f.market->get_listing(1) == Listing::none());
        REQUIRE(f.market->events().listing_updates().back().is_cleared());
        REQUIRE(f.market->delist_item(ALICE, 1) == errors::INVALID_LISTING);
    }
}

// =============================================================================
// Transfer hook
// =============================================================================

TEST_CASE("Listings do not survive a change of owner", "[market][hook]") {
    MarketFixture f;
    REQUIRE(f.market->hook_registered());
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    f.market->events().clear();

    SECTION("Direct transfer") {
        REQUIRE(f.assets.transfer_from(ALICE, ALICE, CAROL, 1) == errors::OK);
        REQUIRE(f.market->get_listing(1) == Listing::none());
        REQUIRE(f.market->events().listing_updates().size() == 1);
        REQUIRE(f.market->events().listing_updates()[0] == ListingUpdated::cleared(1));

        // The old listing cannot be exploited against the new owner
        f.bank.credit(BOB, 100);
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::INCONSISTENT_SALE_PRICE);
        REQUIRE(f.assets.owner_of(1) == CAROL);
    }

    SECTION("Operator transfer") {
        REQUIRE(f.assets.set_approval_for_all(ALICE, CAROL, true) == errors::OK);
        REQUIRE(f.assets.transfer_from(CAROL, ALICE, BOB, 1) == errors::OK);
        REQUIRE(f.market->get_listing(1) == Listing::none());
    }

    SECTION("Burn") {
        REQUIRE(f.assets.burn(ALICE, 1) == errors::OK);
        REQUIRE(f.market->registry().size() == 0);
        REQUIRE(f.market->events().listing_updates()[0].is_cleared());
    }

    SECTION("Expired record is dropped without an event") {
        f.now += 5000;
        REQUIRE(f.assets.transfer_from(ALICE, ALICE, CAROL, 1) == errors::OK);
        REQUIRE(f.market->registry().size() == 0);
        REQUIRE(f.market->events().size() == 0);
    }

    REQUIRE(f.market->hook().invocations() >= 1);
}

TEST_CASE("Marketplace unregisters its hook on destruction", "[market][hook]") {
    MarketFixture f;
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);

    f.market.reset();
    REQUIRE(f.assets.transfer(ALICE, BOB, 1) == errors::OK);
    REQUIRE(f.assets.owner_of(1) == BOB);
}

TEST_CASE("Marketplace invalidates explicitly when the ledger has no hooks", "[market][hook]") {
    loggers::disable();
    Timestamp now = 1000;
    AssetLedger assets;
    HooklessLedger ledger(assets);
    RoyaltyRegistry royalties;
    NativeBank bank;

    Marketplace market(ledger, royalties, bank, MarketConfig(), [&now]() { return now; });
    REQUIRE_FALSE(market.hook_registered());

    REQUIRE(assets.mint(ALICE, 1) == errors::OK);
    REQUIRE(market.list_item(ALICE, 1, 100, now + 10, NATIVE) == errors::OK);
    bank.credit(BOB, 100);

    REQUIRE(market.buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
    REQUIRE(assets.owner_of(1) == BOB);
    REQUIRE(market.get_listing(1) == Listing::none());
    REQUIRE(market.registry().size() == 0);

    auto events = market.events().events();
    REQUIRE(events.size() == 3);
    REQUIRE(std::get<ListingUpdated>(events[1]).is_cleared());
    REQUIRE(std::holds_alternative<Purchased>(events[2]));
}

// =============================================================================
// Reentrancy
// =============================================================================

TEST_CASE("Marketplace rejects reentrant calls", "[market][reentrancy]") {
    MarketFixture f;
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    REQUIRE(f.mint_and_list(2, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 100);
    f.bank.credit(CAROL, 100);

    ScriptedReceiver seller;
    f.bank.set_receiver(ALICE, &seller);

    SECTION("Seller delists mid-purchase") {
        seller.action = [&]() { return f.market->delist_item(ALICE, 1); };
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(seller.results == std::vector<int32_t>{errors::REENTRANCY});
        REQUIRE(f.assets.owner_of(1) == BOB);
    }

    SECTION("Second buy of the same asset mid-purchase") {
        seller.action = [&]() { return f.market->buy_item(CAROL, 1, 100, NATIVE, 100); };
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(seller.results == std::vector<int32_t>{errors::REENTRANCY});
        REQUIRE(f.assets.owner_of(1) == BOB);
        REQUIRE(f.bank.balance_of(CAROL) == 100);
        REQUIRE(f.market->events().purchases().size() == 1);
    }

    SECTION("Global scope blocks other assets too") {
        seller.action = [&]() { return f.market->buy_item(CAROL, 2, 100, NATIVE, 100); };
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(seller.results == std::vector<int32_t>{errors::REENTRANCY});
        REQUIRE(f.assets.owner_of(2) == ALICE);
    }

    // Guard released after the outer purchase
    REQUIRE(f.market->list_item(ALICE, 2, 120, f.now + 10, NATIVE) == errors::OK);
}

TEST_CASE("Per-asset guard scope", "[market][reentrancy]") {
    MarketFixture f(MarketConfig().with_guard_scope(GuardScope::PER_ASSET));
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);
    REQUIRE(f.mint_and_list(2, ALICE, 100) == errors::OK);
    f.bank.credit(BOB, 100);
    f.bank.credit(CAROL, 100);

    ScriptedReceiver seller;
    f.bank.set_receiver(ALICE, &seller);

    SECTION("Same asset still rejected") {
        seller.action = [&]() { return f.market->delist_item(ALICE, 1); };
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(seller.results == std::vector<int32_t>{errors::REENTRANCY});
    }

    SECTION("Other assets proceed") {
        int calls = 0;
        seller.action = [&]() {
            // Only the outer purchase re-enters
            if (calls++ > 0) return errors::OK;
            return f.market->buy_item(CAROL, 2, 100, NATIVE, 100);
        };
        REQUIRE(f.market->buy_item(BOB, 1, 100, NATIVE, 100) == errors::OK);
        REQUIRE(seller.results.front() == errors::OK);
        REQUIRE(f.assets.owner_of(1) == BOB);
        REQUIRE(f.assets.owner_of(2) == CAROL);
        REQUIRE(f.bank.balance_of(ALICE) == 200);
    }
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Concurrent buyers: exactly one wins", "[market][concurrency]") {
    MarketFixture f;
    REQUIRE(f.mint_and_list(1, ALICE, 100) == errors::OK);

    std::vector<Address> buyers;
    for (uint64_t i = 0; i < 8; ++i) {
        buyers.push_back(addresses::from_u64(0x1000 + i));
        f.bank.credit(buyers.back(), 100);
    }

    std::vector<int32_t> results(buyers.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < buyers.size(); ++i) {
        threads.emplace_back([&, i]() {
            results[i] = f.market->buy_item(buyers[i], 1, 100, NATIVE, 100);
        });
    }
    for (auto& t : threads) t.join();

    size_t wins = 0;
    for (auto r : results) {
        if (r == errors::OK) ++wins;
    }
    REQUIRE(wins == 1);
    REQUIRE(f.bank.balance_of(ALICE) == 100);
    REQUIRE(f.bank.total_supply() == 800);
    REQUIRE(f.market->events().purchases().size() == 1);
}
