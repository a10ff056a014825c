// QuickRoute - AMM Math Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/routing/amm.hpp>
#include "support/fakes.hpp"

using namespace quickroute;
using namespace quickroute::routing;
using Catch::Approx;

TEST_CASE("Constant product output", "[amm]") {
    SECTION("Known value") {
        // 1e10 in against 1e12 / 5e8 at 0.3%
        Amount out = amm::get_amount_out(10'000'000'000ULL, 1'000'000'000'000ULL,
                                         500'000'000ULL, 3000);
        REQUIRE(out == 4'935'790);
    }

    SECTION("Zero input or empty reserves") {
        REQUIRE(amm::get_amount_out(0, 1000, 1000, 3000) == 0);
        REQUIRE(amm::get_amount_out(100, 0, 1000, 3000) == 0);
        REQUIRE(amm::get_amount_out(100, 1000, 0, 3000) == 0);
    }

    SECTION("Fee of 100% rejected") {
        REQUIRE_THROWS_AS(amm::get_amount_out(100, 1000, 1000, 1'000'000), std::invalid_argument);
    }

    SECTION("Output never drains the pool") {
        Amount r = amount::pow10(18);
        REQUIRE(amm::get_amount_out(r * 1000, r, r, 3000) < r);
    }
}

TEST_CASE("Invariant holds after the swap", "[amm]") {
    const Amount reserve_in = amount::parse("123456789000000000000000");
    const Amount reserve_out = amount::parse("987654321000000");
    const uint32_t fee = 500;

    for (Amount a : {Amount(1), Amount(1'000'000), amount::parse("5000000000000000000"),
                     amount::parse("100000000000000000000000")}) {
        Amount out = amm::get_amount_out(a, reserve_in, reserve_out, fee);
        U128 scaled_in = reserve_in * amm::FEE_DENOMINATOR;
        U128 effective_in = a * (amm::FEE_DENOMINATOR - fee);

        // (x + a') * (y - out) >= x * y, scaled by the fee denominator
        U128 lhs = amm::mul_div(scaled_in + effective_in, reserve_out - out, amount::pow10(18));
        U128 rhs = amm::mul_div(scaled_in, reserve_out, amount::pow10(18));
        REQUIRE(lhs >= rhs);
        REQUIRE(out < reserve_out);
    }
}

TEST_CASE("Reserves too deep to scale by the fee denominator", "[amm]") {
    const Amount one = amount::pow10(18);

    SECTION("Fee taken first, output still bounded") {
        Amount deep = amount::pow10(33);
        Amount out = amm::get_amount_out(one, deep, deep, 3000);
        REQUIRE(out > 0);
        REQUIRE(out <= amm::mul_div(one, 997'000, 1'000'000));
    }

    SECTION("Denominator beyond 128 bits") {
        Amount max = ~static_cast<Amount>(0);
        REQUIRE_THROWS_AS(amm::get_amount_out(one, max, one, 3000), std::overflow_error);
    }
}

TEST_CASE("mul_div", "[amm]") {
    SECTION("Intermediate above 128 bits") {
        Amount big = amount::pow10(30);
        REQUIRE(amm::mul_div(big, big, big) == big);
    }

    SECTION("Floor rounding") {
        REQUIRE(amm::mul_div(10, 10, 3) == 33);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(amm::mul_div(1, 1, 0), std::domain_error);
        REQUIRE_THROWS_AS(amm::mul_div(amount::pow10(30), amount::pow10(30), 1), std::overflow_error);
    }
}

TEST_CASE("Swap quote through a pool", "[amm]") {
    auto usdc = testing::token("USDC", 6);
    auto weth = testing::token("WETH", 18);

    LiquidityPool pool;
    pool.address = "0xpool";
    pool.token0 = usdc;
    pool.token1 = weth;
    pool.reserve0 = amount::from_units(2'000'000.0, 6);
    pool.reserve1 = amount::from_units(1000.0, 18);
    pool.fee_pips = 3000;

    SECTION("Direction follows token_in") {
        auto q = amm::quote(pool, weth, amount::from_units(1.0, 18));
        REQUIRE(q.reserve_in == pool.reserve1);
        REQUIRE(amount::to_units(q.amount_out, 6) < 2000.0);
        REQUIRE(amount::to_units(q.amount_out, 6) > 1980.0);
        REQUIRE(q.price_impact > 0.3);
        REQUIRE(q.price_impact < 0.5);
    }

    SECTION("Impact grows with size") {
        auto small = amm::quote(pool, usdc, amount::from_units(1000.0, 6));
        auto large = amm::quote(pool, usdc, amount::from_units(500'000.0, 6));
        REQUIRE(large.price_impact > small.price_impact);
    }

    SECTION("Foreign token rejected") {
        REQUIRE_THROWS_AS(amm::quote(pool, testing::token("DAI"), 100), std::invalid_argument);
    }

    SECTION("Fee conversion") {
        REQUIRE(amm::fee_to_pips(0.003) == 3000);
        REQUIRE(amm::fee_to_pips(0.0) == 0);
        REQUIRE(amm::fee_to_pips(2.0) == amm::FEE_DENOMINATOR - 1);
    }
}
