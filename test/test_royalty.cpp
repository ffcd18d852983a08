// mart - Royalty Tests

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <mart/royalty.hpp>

using namespace mart;
using namespace mart::testing;

namespace {

// External configuration with an out-of-range rate
struct FixedRate : IRoyaltyConfig {
    RoyaltyRate rate;
    explicit FixedRate(RoyaltyRate r) : rate(r) {}
    std::optional<RoyaltyRate> royalty_rate(AssetId) const override { return rate; }
};

}  // namespace

TEST_CASE("RoyaltyRegistry settings", "[royalty]") {
    RoyaltyRegistry registry;
    REQUIRE(registry.fee_denominator() == royalty::DEFAULT_FEE_DENOMINATOR);
    REQUIRE_FALSE(registry.royalty_rate(1).has_value());

    SECTION("Validation") {
        REQUIRE(registry.set_default_royalty(CREATOR, 10001) == errors::INVALID_ROYALTY);
        REQUIRE(registry.set_default_royalty(addresses::ZERO, 500) == errors::INVALID_RECEIVER);
        REQUIRE(registry.set_asset_royalty(1, CREATOR, 20000) == errors::INVALID_ROYALTY);
        REQUIRE_FALSE(registry.royalty_rate(1).has_value());
    }

    SECTION("Per-asset overrides default") {
        REQUIRE(registry.set_default_royalty(CREATOR, 500) == errors::OK);
        REQUIRE(registry.set_asset_royalty(2, CAROL, 1000) == errors::OK);

        auto r1 = registry.royalty_rate(1);
        REQUIRE(r1.has_value());
        REQUIRE(r1->receiver == CREATOR);
        REQUIRE(r1->fee_numerator == 500);

        auto r2 = registry.royalty_rate(2);
        REQUIRE(r2->receiver == CAROL);
        REQUIRE(r2->fee_numerator == 1000);

        registry.reset_asset_royalty(2);
        REQUIRE(registry.royalty_rate(2)->receiver == CREATOR);

        registry.delete_default_royalty();
        REQUIRE_FALSE(registry.royalty_rate(1).has_value());
    }

    SECTION("Custom denominator") {
        RoyaltyRegistry percent(100);
        REQUIRE(percent.set_default_royalty(CREATOR, 100) == errors::OK);
        REQUIRE(percent.set_default_royalty(CREATOR, 101) == errors::INVALID_ROYALTY);
        REQUIRE(percent.royalty_rate(1)->fee_denominator == 100);
    }
}

TEST_CASE("RoyaltyCalculator value-added royalties", "[royalty]") {
    RoyaltyRegistry registry;
    RoyaltyCalculator calc(registry);

    SECTION("No configured rate") {
        auto quote = calc.compute(1, 1000, 0);
        REQUIRE(quote.amount == 0);
        REQUIRE(quote.recipient == addresses::ZERO);
    }

    REQUIRE(registry.set_default_royalty(CREATOR, 1000) == errors::OK);  // 10%

    SECTION("Full price when no historical price") {
        auto quote = calc.compute(1, 100, 0);
        REQUIRE(quote.recipient == CREATOR);
        REQUIRE(quote.amount == 10);
    }

    SECTION("Only appreciation is taxed") {
        REQUIRE(calc.compute(1, 1000, 600).amount == 40);
    }

    SECTION("Sold at or below cost pays nothing, recipient still reported") {
        auto at_cost = calc.compute(1, 500, 500);
        REQUIRE(at_cost.amount == 0);
        REQUIRE(at_cost.recipient == CREATOR);

        auto below = calc.compute(1, 500, 900);
        REQUIRE(below.amount == 0);
        REQUIRE(below.recipient == CREATOR);
    }

    SECTION("Rounds down") {
        REQUIRE(calc.compute(1, 19, 0).amount == 1);
        REQUIRE(calc.compute(1, 9, 0).amount == 0);
    }

    SECTION("Prices near the top of the 128-bit range") {
        Amount big = static_cast<Amount>(1) << 120;
        REQUIRE(calc.compute(1, big, 0).amount == big / 10);

        Amount max = ~static_cast<Amount>(0);
        REQUIRE(calc.compute(1, max, 0).amount == max / 10);
        REQUIRE(calc.compute(1, max, max - 1000).amount == 100);
    }
}

TEST_CASE("RoyaltyCalculator caps misconfigured external rates", "[royalty]") {
    FixedRate config(RoyaltyRate{CREATOR, 3, 2});
    RoyaltyCalculator calc(config);

    auto quote = calc.compute(1, 100, 0);
    REQUIRE(quote.amount == 100);
    REQUIRE(RoyaltyCalculator::taxable_basis(100, 30) == 70);
    REQUIRE(RoyaltyCalculator::taxable_basis(30, 100) == 0);

    Amount max = ~static_cast<Amount>(0);
    REQUIRE(calc.compute(1, max, 0).amount == max);
    Amount half = max - max / 2;
    REQUIRE(calc.compute(1, max, max / 2).amount == half / 2 * 3);
}

TEST_CASE("RoyaltyCalculator full rate on the largest price", "[royalty]") {
    FixedRate config(RoyaltyRate{CREATOR, 10000, 10000});
    RoyaltyCalculator calc(config);

    Amount max = ~static_cast<Amount>(0);
    REQUIRE(calc.compute(1, max, 0).amount == max);
    REQUIRE(calc.compute(1, max, 1).amount == max - 1);
}
